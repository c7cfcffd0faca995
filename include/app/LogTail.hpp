#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace devmon::app {

// Stateless reads of the monitored log. Every call reopens the file, so lines
// appended between calls may shift which lines count as the last N.

// At most max_lines trailing lines, oldest first, without newlines.
// Empty when the file cannot be opened or read.
[[nodiscard]] std::vector<std::string> tail_lines(const std::string& path, size_t max_lines);

// Whole file contents, or an empty string on any I/O error.
[[nodiscard]] std::string read_full(const std::string& path);

} // namespace devmon::app
