#include "app/ErrorExtractor.hpp"
#include "util/AsciiLower.hpp"

#include <initializer_list>

namespace devmon::app {

static bool contains_any(const std::string& lower, std::initializer_list<std::string_view> needles) {
  for (auto n : needles)
    if (lower.find(n) != std::string::npos) return true;
  return false;
}

static std::string_view trim_ws(std::string_view sv) {
  auto ws = [](char c){ return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f'; };
  while (!sv.empty() && ws(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && ws(sv.back())) sv.remove_suffix(1);
  return sv;
}

bool is_trigger_line(std::string_view line) {
  return contains_any(devmon::util::ascii_lower_copy(line), {"error", "panic", "fail"});
}

bool any_trigger(const std::vector<std::string>& lines) {
  for (const auto& l : lines)
    if (is_trigger_line(l)) return true;
  return false;
}

bool is_continuation_line(std::string_view line) {
  if (line.find('\t') != std::string_view::npos) return true;
  auto t = trim_ws(line);
  return t.empty()
      || t.starts_with('/')
      || t.starts_with("main.")
      || t.starts_with("runtime.")
      || t.starts_with("goroutine ");
}

bool is_trace_marker_line(std::string_view line) {
  auto t = trim_ws(line);
  return t.starts_with("goroutine ") || t.starts_with("runtime.");
}

std::optional<devmon::model::ErrorBlock> extract_last_error(std::string_view text) {
  enum class State { Normal, InError };
  State state = State::Normal;
  std::vector<std::string> block;

  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) end = text.size();
    std::string_view line = text.substr(start, end - start);
    start = end + 1;

    if (is_trace_marker_line(line)) {
      if (state == State::InError) block.emplace_back(line);
      continue;
    }
    if (is_trigger_line(line)) {
      block.assign(1, std::string(line));
      state = State::InError;
      continue;
    }
    if (state == State::InError) {
      if (is_continuation_line(line)) block.emplace_back(line);
      else state = State::Normal;
    }
  }

  if (block.empty()) return std::nullopt;
  return devmon::model::ErrorBlock{std::move(block)};
}

LogTone classify_line(std::string_view line) {
  auto lower = devmon::util::ascii_lower_copy(line);
  if (contains_any(lower, {"error", "fail", "panic"})) return LogTone::Error;
  if (contains_any(lower, {"warn"})) return LogTone::Warn;
  if (contains_any(lower, {"info"})) return LogTone::Info;
  if (contains_any(lower, {"building", "compiled"})) return LogTone::Build;
  if (contains_any(lower, {"watching", "ready"})) return LogTone::Watch;
  if (contains_any(lower, {"hmr", "hot"})) return LogTone::Hot;
  return LogTone::Plain;
}

} // namespace devmon::app
