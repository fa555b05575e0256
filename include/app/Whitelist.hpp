#pragma once
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace ransomwatch::app {

// Process names excluded from the suspicion ranking. Entries match the
// process name case-insensitively; an entry written as "re:<pattern>" is
// an icase regex searched in the name.
class ProcessWhitelist {
public:
  ProcessWhitelist() = default;
  explicit ProcessWhitelist(const std::vector<std::string>& entries);

  // Throws std::regex_error for a malformed "re:" entry.
  void add(const std::string& entry);
  [[nodiscard]] bool contains(std::string_view process_name) const;
  [[nodiscard]] size_t size() const { return names_.size() + patterns_.size(); }

  // "a, b,c" -> {"a","b","c"}; empty items dropped
  [[nodiscard]] static std::vector<std::string> split_list(std::string_view csv);

private:
  std::unordered_set<std::string> names_;
  std::vector<std::regex> patterns_;
};

} // namespace ransomwatch::app
