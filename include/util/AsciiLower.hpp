#pragma once

#include <array>
#include <string>
#include <string_view>

namespace devmon::util {

// Locale-independent ASCII lowercase via a compile-time table.
inline constexpr std::array<unsigned char, 256> kAsciiLower = []{
  std::array<unsigned char, 256> t{};
  for (int i = 0; i < 256; ++i) {
    t[i] = static_cast<unsigned char>((i >= 'A' && i <= 'Z') ? i + ('a' - 'A') : i);
  }
  return t;
}();

[[nodiscard]] constexpr unsigned char ascii_lower(unsigned char c) { return kAsciiLower[c]; }

[[nodiscard]] inline std::string ascii_lower_copy(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(ascii_lower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace devmon::util
