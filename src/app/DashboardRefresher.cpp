#include "app/DashboardRefresher.hpp"
#include "app/ErrorExtractor.hpp"
#include "app/LogTail.hpp"

namespace devmon::app {

DashboardRefresher::DashboardRefresher(const ServiceMonitor& services,
                                       devmon::collectors::StorageProbe storage,
                                       std::string log_path, size_t tail_lines)
  : services_(services), storage_(std::move(storage)),
    log_path_(std::move(log_path)), tail_lines_(tail_lines) {}

void DashboardRefresher::refresh(devmon::model::DashboardState& state,
                                 devmon::model::Clock::time_point now) const {
  state.services = services_.sample();
  state.system = services_.system();
  state.storage = storage_.sample();
  state.log_tail = tail_lines(log_path_, tail_lines_);
  state.has_error = any_trigger(state.log_tail);
  state.updated_at = now;
}

} // namespace devmon::app
