#pragma once
#include <cstdint>

namespace devmon::collectors {

struct CpuTimes {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
  uint64_t total() const { return user + nice + system + idle + iowait + irq + softirq + steal; }
  uint64_t work()  const { return user + nice + system + irq + softirq + steal; }
};

// Aggregate busy share from /proc/stat between consecutive samples.
class CpuCollector {
public:
  CpuCollector() = default;
  // usage_pct is 0 on the first call (no delta yet). Returns false if /proc/stat is unreadable.
  bool sample(double& usage_pct);
private:
  CpuTimes last_{};
  bool has_last_{false};
};

} // namespace devmon::collectors
