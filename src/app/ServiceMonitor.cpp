#include "app/ServiceMonitor.hpp"

namespace devmon::app {

ServiceMonitor::ServiceMonitor(devmon::collectors::ISampleProvider& provider,
                               std::vector<devmon::model::ServiceSpec> services)
  : provider_(provider), services_(std::move(services)) {}

std::vector<devmon::model::ServiceRow> ServiceMonitor::sample() const {
  std::vector<devmon::model::ServiceRow> rows;
  rows.reserve(services_.size());
  for (const auto& svc : services_) {
    devmon::model::ServiceRow row{svc.name, std::nullopt, svc.color};
    std::optional<int32_t> pid = svc.pid;
    if (!pid && !svc.pattern.empty()) pid = provider_.find_pid_by_pattern(svc.pattern);
    if (pid) row.sample = provider_.sample_by_pid(*pid);
    rows.push_back(std::move(row));
  }
  return rows;
}

devmon::model::SystemSample ServiceMonitor::system() const {
  auto s = provider_.system_sample();
  if (!s.known()) return devmon::model::SystemSample{};
  return s;
}

} // namespace devmon::app
