#pragma once

#include <cstdint>
#include <string>

namespace devmon::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string rpad_trunc(const std::string& s, int w);

// Fixed-precision numbers: fmt_fixed(12.345, 1) -> "12.3"
std::string fmt_fixed(double v, int decimals);
std::string fmt_pct(double pct);   // "12.3%"
std::string fmt_mb(double mb);     // "512.0MB"

} // namespace devmon::ui
