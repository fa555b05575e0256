#pragma once

#include <cstdint>
#include <string>

namespace ransomwatch::ui {

// UTF-8 text width utilities (process names may be non-ASCII)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string rpad_trunc(const std::string& s, int w);

// Human-sized units, one decimal: "512 B", "12.3 KB", "4.0 MB"
std::string format_bytes(double bytes);
// Same scale with a per-second suffix: "12.3 KB/s", "200.0 MB/s"
std::string format_rate(double bytes_per_s);
// Local "YYYY-MM-DD HH:MM:SS" for a wall-clock millisecond timestamp
std::string format_timestamp(int64_t ms);

} // namespace ransomwatch::ui
