#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include "app/DashboardRefresher.hpp"
#include "app/InputDispatcher.hpp"
#include "model/Dashboard.hpp"
#include "ui/IKeySource.hpp"
#include "ui/IRenderSurface.hpp"

namespace devmon::app {

// Single-threaded cooperative scheduler. Each tick:
//   1. poll: take at most one pending key (never waits) and dispatch it
//   2. refresh: rebuild the dashboard from providers and render it
// then sleep until the next fixed interval. The loop owns DashboardState;
// nothing else writes it, so no locking is involved.
class EventLoop {
public:
  EventLoop(devmon::ui::IKeySource& keys, InputDispatcher& dispatcher,
            const DashboardRefresher& refresher, devmon::ui::IRenderSurface& surface,
            std::chrono::milliseconds interval, bool debug = false);

  // One poll + refresh + render pass at time now.
  void tick(devmon::model::Clock::time_point now);

  // Tick until stop is set or max_ticks (0 = unbounded) have run.
  // Returns the number of ticks executed. With debug on, each tick's
  // duration goes to stderr.
  uint64_t run(const std::atomic<bool>& stop, uint64_t max_ticks = 0);

  [[nodiscard]] const devmon::model::DashboardState& state() const { return state_; }
  [[nodiscard]] std::chrono::milliseconds interval() const { return interval_; }

private:
  // Sleeps in short slices so a stop request ends the wait promptly.
  static void wait_until(devmon::model::Clock::time_point deadline, const std::atomic<bool>& stop);

  devmon::ui::IKeySource& keys_;
  InputDispatcher& dispatcher_;
  const DashboardRefresher& refresher_;
  devmon::ui::IRenderSurface& surface_;
  std::chrono::milliseconds interval_;
  bool debug_;
  devmon::model::DashboardState state_{};
};

} // namespace devmon::app
