#include "ui/Formatting.hpp"
#include <cstdio>
#include <ctime>

namespace ransomwatch::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i = 0; i < s.size();) {
    i += static_cast<size_t>(u8_len(static_cast<unsigned char>(s[i])));
    cols += 1;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols){
  if (cols <= 0) return std::string();
  std::string out;
  out.reserve(s.size());
  int seen = 0;
  size_t i = 0;
  while (i < s.size() && seen < cols) {
    size_t len = static_cast<size_t>(u8_len(static_cast<unsigned char>(s[i])));
    if (i + len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
    seen += 1;
  }
  return out;
}

std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return s + std::string(static_cast<size_t>(w - cols), ' ');
  if (w <= 1) return take_cols(s, w);
  return take_cols(s, w - 1) + ".";
}

std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return "";
  int cols = display_cols(s);
  if (cols == w) return s;
  if (cols < w) return std::string(static_cast<size_t>(w - cols), ' ') + s;
  return take_cols(s, w);
}

std::string format_bytes(double bytes) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
  if (bytes < 0) bytes = 0;
  int u = 0;
  while (bytes >= 1024.0 && u < 4) { bytes /= 1024.0; ++u; }
  char buf[32];
  if (u == 0) std::snprintf(buf, sizeof(buf), "%.0f B", bytes);
  else std::snprintf(buf, sizeof(buf), "%.1f %s", bytes, units[u]);
  return buf;
}

std::string format_rate(double bytes_per_s) {
  return format_bytes(bytes_per_s) + "/s";
}

std::string format_timestamp(int64_t ms) {
  std::time_t t = static_cast<std::time_t>(ms / 1000);
  std::tm lt{};
  ::localtime_r(&t, &lt);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &lt);
  return buf;
}

} // namespace ransomwatch::ui
