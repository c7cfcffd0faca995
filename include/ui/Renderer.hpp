#pragma once

#include "model/Dashboard.hpp"
#include "app/ErrorExtractor.hpp"
#include "ui/IRenderSurface.hpp"
#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devmon::ui {

struct FrameOptions {
  std::string title{"miau DEV MONITOR"};
  std::string url{"http://localhost:9245"};
  std::chrono::milliseconds refresh{2000};
  std::chrono::milliseconds status_ttl{5000};
  int tail_lines{18};
};

// Box drawing
std::vector<std::string> make_box(
    const std::string& title,
    const std::vector<std::string>& lines,
    int width,
    int min_height = 0,
    const std::string& border_sgr = std::string()
);

// SGR prefix for a log tone; empty for Plain
std::string tone_sgr(devmon::app::LogTone tone);

// SGR foreground code for a colour name ("green", "cyan", ...); nullptr if unknown.
[[nodiscard]] const char* service_color_code(std::string_view name);

// Whole frame as rows of at most `cols` display columns, top to bottom.
// Pure with respect to the terminal: size comes from the caller.
std::vector<std::string> compose_frame(const devmon::model::DashboardState& s,
                                       const FrameOptions& opt, int cols, int rows);

// Writes frames to stdout, homing the cursor instead of clearing.
class TerminalRenderer : public IRenderSurface {
public:
  explicit TerminalRenderer(FrameOptions opt) : opt_(std::move(opt)) {}
  void render(const devmon::model::DashboardState& state) override;
private:
  FrameOptions opt_;
};

} // namespace devmon::ui
