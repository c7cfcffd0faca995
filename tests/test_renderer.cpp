#include "minitest.hpp"
#include "ui/Formatting.hpp"
#include "ui/Renderer.hpp"
#include <string>
#include <vector>

using namespace std::chrono_literals;
using devmon::ui::compose_frame;
using devmon::ui::display_cols;

static bool frame_has(const std::vector<std::string>& frame, const std::string& needle) {
  for (const auto& l : frame)
    if (l.find(needle) != std::string::npos) return true;
  return false;
}

static devmon::model::DashboardState sample_state() {
  devmon::model::DashboardState st;
  st.updated_at = devmon::model::Clock::time_point{} + 500s;
  st.services.push_back({"wails3 dev", devmon::model::ProcessSample{12.5, 3.25, 256.0}});
  st.services.push_back({"Vite (Svelte)", std::nullopt});
  st.system = {7.5, 1024, 4096};
  st.log_tail = {"INFO starting", "vite ready in 200ms"};
  return st;
}

TEST(frame_lines_fill_exact_width) {
  auto st = sample_state();
  st.log_tail.push_back(std::string(300, 'x'));
  st.log_tail.push_back("\tat main.run");
  auto frame = compose_frame(st, {}, 80, 40);
  ASSERT_FALSE(frame.empty());
  for (const auto& l : frame) ASSERT_EQ(display_cols(l), 80);
}

TEST(frame_shows_header_services_and_footer) {
  auto st = sample_state();
  devmon::ui::FrameOptions opt;
  auto frame = compose_frame(st, opt, 100, 40);
  ASSERT_TRUE(frame_has(frame, "miau DEV MONITOR"));
  ASSERT_TRUE(frame_has(frame, "http://localhost:9245"));
  ASSERT_TRUE(frame_has(frame, "Ctrl+C to stop"));
  ASSERT_TRUE(frame_has(frame, "12.5%"));
  ASSERT_TRUE(frame_has(frame, "256.0MB"));
  ASSERT_TRUE(frame_has(frame, "SQLite DB"));
  ASSERT_TRUE(frame_has(frame, "CPU 7.5%"));
  ASSERT_TRUE(frame_has(frame, "RAM 1024/4096MB (25.0%)"));
  ASSERT_TRUE(frame_has(frame, "Refresh: 2s"));
  ASSERT_TRUE(frame_has(frame, "vite ready in 200ms"));
}

TEST(frame_absent_service_shows_dashes) {
  auto st = sample_state();
  auto frame = compose_frame(st, {}, 100, 40);
  for (const auto& l : frame) {
    if (l.find("Vite (Svelte)") == std::string::npos) continue;
    ASSERT_TRUE(l.find('-') != std::string::npos);
    ASSERT_TRUE(l.find('%') == std::string::npos);
    ASSERT_TRUE(l.find("MB") == std::string::npos);
  }
}

TEST(frame_unknown_system_renders_question_mark) {
  auto st = sample_state();
  st.system = {};
  auto frame = compose_frame(st, {}, 100, 40);
  ASSERT_TRUE(frame_has(frame, "RAM ?"));
  ASSERT_FALSE(frame_has(frame, "0MB ("));
}

TEST(frame_error_badge_follows_flag) {
  auto st = sample_state();
  ASSERT_FALSE(frame_has(compose_frame(st, {}, 100, 40), "[E] copy error"));
  st.log_tail.push_back("ERROR boom");
  st.has_error = true;
  ASSERT_TRUE(frame_has(compose_frame(st, {}, 100, 40), "[E] copy error"));
}

TEST(frame_empty_log_waits) {
  auto st = sample_state();
  st.log_tail.clear();
  ASSERT_TRUE(frame_has(compose_frame(st, {}, 100, 40), "Waiting for logs..."));
}

TEST(frame_status_shown_only_while_visible) {
  auto st = sample_state();
  st.status = devmon::model::StatusMessage{"Error copied!", st.updated_at - 1s};
  ASSERT_TRUE(frame_has(compose_frame(st, {}, 100, 40), "Error copied!"));
  st.status->created_at = st.updated_at - 6s;
  ASSERT_FALSE(frame_has(compose_frame(st, {}, 100, 40), "Error copied!"));
  devmon::ui::FrameOptions longer;
  longer.status_ttl = 10s;
  ASSERT_TRUE(frame_has(compose_frame(st, longer, 100, 40), "Error copied!"));
}

TEST(frame_log_box_keeps_newest_lines_when_short) {
  auto st = sample_state();
  st.log_tail.clear();
  for (int i = 0; i < 18; ++i) st.log_tail.push_back("line " + std::to_string(i));
  auto frame = compose_frame(st, {}, 80, 16);
  ASSERT_TRUE(frame_has(frame, "line 17"));
  ASSERT_FALSE(frame_has(frame, "line 0 "));
}

TEST(frame_refresh_label_fractional) {
  devmon::ui::FrameOptions opt;
  opt.refresh = 1500ms;
  ASSERT_TRUE(frame_has(compose_frame(sample_state(), opt, 100, 40), "Refresh: 1.5s"));
}

TEST(service_colors_map_names_to_sgr_codes) {
  using devmon::ui::service_color_code;
  ASSERT_EQ(std::string(service_color_code("green")), "32");
  ASSERT_EQ(std::string(service_color_code("cyan")), "96");
  ASSERT_EQ(std::string(service_color_code("yellow")), "33");
  ASSERT_TRUE(service_color_code("") == nullptr);
  ASSERT_TRUE(service_color_code("chartreuse") == nullptr);
}

TEST(formatting_width_helpers) {
  using namespace devmon::ui;
  ASSERT_EQ(display_cols("\x1B[31mred\x1B[0m"), 3);
  ASSERT_EQ(display_cols("●○"), 2);
  ASSERT_EQ(trunc_pad("ab", 4), "ab  ");
  ASSERT_EQ(display_cols(trunc_pad("abcdefgh", 4)), 4);
  ASSERT_EQ(rpad_trunc("7", 3), "  7");
  ASSERT_EQ(take_cols("\x1B[1mabc", 2), "\x1B[1mab");
  ASSERT_EQ(fmt_pct(12.345), "12.3%");
  ASSERT_EQ(fmt_mb(0.04), "0.0MB");
  ASSERT_EQ(fmt_fixed(2.0, 0), "2");
}
