#pragma once
#include <cstddef>
#include <string>
#include "app/ServiceMonitor.hpp"
#include "collectors/StorageProbe.hpp"
#include "model/Dashboard.hpp"

namespace devmon::app {

// Recomputes the provider-derived fields of DashboardState. The status
// message is left alone; only the input dispatcher writes it.
class DashboardRefresher {
public:
  DashboardRefresher(const ServiceMonitor& services, devmon::collectors::StorageProbe storage,
                     std::string log_path, size_t tail_lines);

  void refresh(devmon::model::DashboardState& state, devmon::model::Clock::time_point now) const;

private:
  const ServiceMonitor& services_;
  devmon::collectors::StorageProbe storage_;
  std::string log_path_;
  size_t tail_lines_;
};

} // namespace devmon::app
