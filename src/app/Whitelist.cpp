#include "app/Whitelist.hpp"
#include <cctype>

namespace ransomwatch::app {

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

ProcessWhitelist::ProcessWhitelist(const std::vector<std::string>& entries) {
  for (const auto& e : entries) add(e);
}

void ProcessWhitelist::add(const std::string& entry) {
  if (entry.rfind("re:", 0) == 0) {
    patterns_.emplace_back(entry.substr(3), std::regex::icase);
    return;
  }
  if (!entry.empty()) names_.insert(lower(entry));
}

bool ProcessWhitelist::contains(std::string_view process_name) const {
  if (names_.count(lower(process_name))) return true;
  for (const auto& re : patterns_) {
    if (std::regex_search(process_name.begin(), process_name.end(), re)) return true;
  }
  return false;
}

std::vector<std::string> ProcessWhitelist::split_list(std::string_view csv) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= csv.size()) {
    auto comma = csv.find(',', start);
    if (comma == std::string_view::npos) comma = csv.size();
    auto item = csv.substr(start, comma - start);
    while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front()))) item.remove_prefix(1);
    while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back()))) item.remove_suffix(1);
    if (!item.empty()) out.emplace_back(item);
    start = comma + 1;
  }
  return out;
}

} // namespace ransomwatch::app
