#include "minitest.hpp"
#include "util/Log.hpp"

int main() {
  // keep expected warnings from drowning the test report
  if (!std::getenv("RANSOMWATCH_TEST_VERBOSE"))
    ransomwatch::util::set_log_level(ransomwatch::util::LogLevel::Error);
  return mini::run_all();
}
