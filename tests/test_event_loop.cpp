#include "minitest.hpp"
#include "fakes.hpp"
#include "app/DashboardRefresher.hpp"
#include "app/EventLoop.hpp"
#include "app/InputDispatcher.hpp"
#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using devmon::ui::Config;

static fs::path make_dir(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("devmon_test_loop_") + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root);
  return root;
}

// Everything one loop needs, wired against fakes and a temp log.
struct Rig {
  fs::path dir;
  devmon::testing::FakeProvider provider;
  devmon::testing::FakeClipboard clipboard;
  devmon::testing::ScriptedKeys keys;
  devmon::testing::RecordingSurface surface;
  devmon::app::ServiceMonitor monitor;
  devmon::app::DashboardRefresher refresher;
  devmon::app::InputDispatcher dispatcher;
  devmon::app::EventLoop loop;

  explicit Rig(const char* tag, std::chrono::milliseconds interval = 1ms, bool debug = false)
    : dir(make_dir(tag)),
      monitor(provider, {{"api", 42, ""}, {"web", std::nullopt, "vite"}}),
      refresher(monitor, devmon::collectors::StorageProbe((dir / "app.db").string()),
                (dir / "dev.log").string(), 18),
      dispatcher({(dir / "dev.log").string(), (dir / "dump.txt").string(), false},
                 {{'e', Config::Action::EXTRACT_ERROR}}, clipboard),
      loop(keys, dispatcher, refresher, surface, interval, debug) {
    provider.procs[42] = {5.0, 1.0, 100.0};
    provider.sys = {10.0, 1000, 4000};
  }
};

TEST(loop_status_from_key_is_visible_in_same_frame) {
  Rig rig("samerender");
  std::ofstream(rig.dir / "dev.log") << "ERROR boom\n\tat main.x\n";
  rig.keys.script.push_back('e');
  auto now = devmon::model::Clock::now();
  rig.loop.tick(now);
  ASSERT_EQ(rig.surface.frames.size(), 1u);
  const auto& f = rig.surface.frames[0];
  ASSERT_TRUE(f.status.has_value());
  ASSERT_EQ(f.status->text, std::string(devmon::app::kStatusCopied));
  ASSERT_TRUE(f.status->visible(f.updated_at));
  ASSERT_TRUE(f.has_error);
  ASSERT_EQ(f.tick, 1u);
}

TEST(loop_takes_one_key_per_tick) {
  Rig rig("onekey");
  std::ofstream(rig.dir / "dev.log") << "panic: x\n";
  rig.keys.script.push_back('e');
  rig.keys.script.push_back('e');
  auto t0 = devmon::model::Clock::now();
  rig.loop.tick(t0);
  ASSERT_EQ(rig.clipboard.copies.size(), 1u);
  rig.loop.tick(t0 + 2s);
  ASSERT_EQ(rig.clipboard.copies.size(), 2u);
  ASSERT_TRUE(rig.loop.state().status->created_at == t0 + 2s);
}

TEST(loop_status_expires_but_is_not_cleared) {
  Rig rig("expire");
  rig.keys.script.push_back('e');
  auto t0 = devmon::model::Clock::time_point{} + 100s;
  rig.loop.tick(t0);
  ASSERT_EQ(rig.loop.state().status->text, std::string(devmon::app::kStatusNoError));
  rig.loop.tick(t0 + 6s);
  const auto& st = rig.loop.state();
  ASSERT_TRUE(st.status.has_value());
  ASSERT_FALSE(st.status->visible(st.updated_at));
}

TEST(loop_run_honours_preset_stop) {
  Rig rig("stopped");
  std::atomic<bool> stop{true};
  ASSERT_EQ(rig.loop.run(stop), 0u);
  ASSERT_EQ(rig.keys.polls, 0);
  ASSERT_TRUE(rig.surface.frames.empty());
}

TEST(loop_run_bounded_ticks) {
  Rig rig("bounded", 5ms);
  std::atomic<bool> stop{false};
  auto start = devmon::model::Clock::now();
  ASSERT_EQ(rig.loop.run(stop, 3), 3u);
  auto took = devmon::model::Clock::now() - start;
  ASSERT_EQ(rig.surface.frames.size(), 3u);
  ASSERT_EQ(rig.keys.polls, 3);
  ASSERT_EQ(rig.loop.state().tick, 3u);
  // Two waits between three ticks, none after the last
  ASSERT_TRUE(took >= 10ms);
  ASSERT_TRUE(took < 2s);
}

TEST(loop_run_stop_during_render_ends_wait_promptly) {
  Rig rig("stopmid", 10s);
  std::atomic<bool> stop{false};
  rig.surface.stop_on_render = &stop;
  auto start = devmon::model::Clock::now();
  ASSERT_EQ(rig.loop.run(stop), 1u);
  auto took = devmon::model::Clock::now() - start;
  ASSERT_EQ(rig.surface.frames.size(), 1u);
  ASSERT_TRUE(took < 200ms);
}

TEST(loop_debug_reports_tick_duration) {
  Rig rig("debugtick", 1ms, true);
  auto log = rig.dir / "stderr.txt";
  std::fflush(stderr);
  int saved = ::dup(STDERR_FILENO);
  FILE* sink = std::fopen(log.c_str(), "w");
  ASSERT_TRUE(sink != nullptr);
  ::dup2(::fileno(sink), STDERR_FILENO);
  std::atomic<bool> stop{false};
  auto ran = rig.loop.run(stop, 2);
  std::fflush(stderr);
  ::dup2(saved, STDERR_FILENO);
  ::close(saved);
  std::fclose(sink);
  ASSERT_EQ(ran, 2u);
  std::ifstream in(log);
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  ASSERT_TRUE(text.find("devmon: tick 1 took ") != std::string::npos);
  ASSERT_TRUE(text.find("devmon: tick 2 took ") != std::string::npos);
}

TEST(loop_without_debug_stays_quiet) {
  Rig rig("quiettick");
  auto log = rig.dir / "stderr.txt";
  std::fflush(stderr);
  int saved = ::dup(STDERR_FILENO);
  FILE* sink = std::fopen(log.c_str(), "w");
  ASSERT_TRUE(sink != nullptr);
  ::dup2(::fileno(sink), STDERR_FILENO);
  std::atomic<bool> stop{false};
  rig.loop.run(stop, 2);
  std::fflush(stderr);
  ::dup2(saved, STDERR_FILENO);
  ::close(saved);
  std::fclose(sink);
  ASSERT_EQ(fs::file_size(log), 0u);
}

TEST(refresher_fills_provider_fields_and_keeps_status) {
  Rig rig("refresh");
  std::ofstream(rig.dir / "dev.log") << "vite ready\nINFO compiled\n";
  std::ofstream(rig.dir / "app.db", std::ios::binary) << std::string(2 * 1024 * 1024, 'x');
  devmon::model::DashboardState st;
  auto now = devmon::model::Clock::now();
  st.status = devmon::model::StatusMessage{"kept", now - 1s};
  rig.refresher.refresh(st, now);
  ASSERT_EQ(st.services.size(), 2u);
  ASSERT_TRUE(st.services[0].sample.has_value());
  ASSERT_FALSE(st.services[1].sample.has_value());
  ASSERT_EQ(st.system.mem_total_mb, 4000u);
  ASSERT_TRUE(st.storage.exists);
  ASSERT_NEAR(st.storage.size_mb, 2.0, 1e-9);
  ASSERT_EQ(st.log_tail.size(), 2u);
  ASSERT_FALSE(st.has_error);
  ASSERT_TRUE(st.updated_at == now);
  ASSERT_EQ(st.status->text, std::string("kept"));
}

TEST(refresher_missing_files_degrade_to_empty) {
  Rig rig("missing");
  devmon::model::DashboardState st;
  rig.refresher.refresh(st, devmon::model::Clock::now());
  ASSERT_TRUE(st.log_tail.empty());
  ASSERT_FALSE(st.has_error);
  ASSERT_FALSE(st.storage.exists);
}
