#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "model/Dashboard.hpp"

namespace devmon::app {

// A trigger line contains "error", "panic" or "fail" (ASCII case-insensitive).
[[nodiscard]] bool is_trigger_line(std::string_view line);

// True if any line is a trigger line.
[[nodiscard]] bool any_trigger(const std::vector<std::string>& lines);

// Line shapes accepted after a trigger: leading '/', "main.", "runtime.",
// "goroutine ", blank (after trimming) or any tab character.
[[nodiscard]] bool is_continuation_line(std::string_view line);

// Go trace markers: "goroutine " or "runtime." after trimming. Appended while
// IN_ERROR, skipped while NORMAL, never a trigger.
[[nodiscard]] bool is_trace_marker_line(std::string_view line);

// Most recent error block in text, scanning top to bottom with two states:
//   NORMAL   - a trigger line starts a new block (the old candidate is dropped).
//   IN_ERROR - a trigger line restarts the block; otherwise continuation
//              lines extend it and any other line returns to NORMAL, keeping
//              the block as the current candidate.
// Trace markers are handled first. For every other line the trigger test runs
// before the continuation test.
[[nodiscard]] std::optional<devmon::model::ErrorBlock> extract_last_error(std::string_view text);

// Display tone of a log line, checked in declaration order.
enum class LogTone { Error, Warn, Info, Build, Watch, Hot, Plain };
[[nodiscard]] LogTone classify_line(std::string_view line);

} // namespace devmon::app
