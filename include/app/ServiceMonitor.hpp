#pragma once
#include <vector>
#include "collectors/ISampleProvider.hpp"
#include "model/Dashboard.hpp"

namespace devmon::app {

// Resolves each configured service to a sample or to "down".
class ServiceMonitor {
public:
  ServiceMonitor(devmon::collectors::ISampleProvider& provider,
                 std::vector<devmon::model::ServiceSpec> services);

  // One row per service, in configured order. A service with neither a pid
  // nor a pattern, or whose lookup finds nothing, reports no sample.
  [[nodiscard]] std::vector<devmon::model::ServiceRow> sample() const;

  // Never throws; provider failures yield an unknown SystemSample.
  [[nodiscard]] devmon::model::SystemSample system() const;

  [[nodiscard]] const std::vector<devmon::model::ServiceSpec>& services() const { return services_; }

private:
  devmon::collectors::ISampleProvider& provider_;
  std::vector<devmon::model::ServiceSpec> services_;
};

} // namespace devmon::app
