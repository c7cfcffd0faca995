#include "app/EventLoop.hpp"

#include <algorithm>
#include <cstdio>
#include <thread>

using namespace std::chrono_literals;

namespace devmon::app {

EventLoop::EventLoop(devmon::ui::IKeySource& keys, InputDispatcher& dispatcher,
                     const DashboardRefresher& refresher, devmon::ui::IRenderSurface& surface,
                     std::chrono::milliseconds interval, bool debug)
  : keys_(keys), dispatcher_(dispatcher), refresher_(refresher), surface_(surface),
    interval_(std::max(interval, std::chrono::milliseconds(0))), debug_(debug) {}

void EventLoop::tick(devmon::model::Clock::time_point now) {
  // Input first so a status set this tick shows in this tick's frame
  if (auto key = keys_.poll_key()) {
    dispatcher_.handle_key(*key, now, state_);
  }
  refresher_.refresh(state_, now);
  state_.tick++;
  surface_.render(state_);
}

void EventLoop::wait_until(devmon::model::Clock::time_point deadline, const std::atomic<bool>& stop) {
  while (!stop.load()) {
    auto now = devmon::model::Clock::now();
    if (now >= deadline) return;
    std::this_thread::sleep_for(std::min<devmon::model::Clock::duration>(deadline - now, 50ms));
  }
}

uint64_t EventLoop::run(const std::atomic<bool>& stop, uint64_t max_ticks) {
  uint64_t ticks = 0;
  auto next = devmon::model::Clock::now();
  while (!stop.load() && (max_ticks == 0 || ticks < max_ticks)) {
    auto now = devmon::model::Clock::now();
    tick(now);
    ++ticks;
    auto after = devmon::model::Clock::now();
    if (debug_) {
      auto took = std::chrono::duration_cast<std::chrono::milliseconds>(after - now).count();
      std::fprintf(stderr, "devmon: tick %llu took %lld ms\n",
                   static_cast<unsigned long long>(state_.tick), static_cast<long long>(took));
    }
    if (max_ticks != 0 && ticks >= max_ticks) break;
    next += interval_;
    // Slow providers overran the slot: restart the cadence instead of bursting
    if (next < after) next = after + interval_;
    wait_until(next, stop);
  }
  return ticks;
}

} // namespace devmon::app
