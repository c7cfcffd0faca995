#pragma once
#include "collectors/ISampleProvider.hpp"
#include "collectors/CpuCollector.hpp"
#include "collectors/MemoryCollector.hpp"

namespace devmon::collectors {

class ProcfsSampleProvider : public ISampleProvider {
public:
  ProcfsSampleProvider() = default;
  std::optional<devmon::model::ProcessSample> sample_by_pid(int32_t pid) override;
  std::optional<int32_t> find_pid_by_pattern(const std::string& pattern) override;
  devmon::model::SystemSample system_sample() override;
  const char* name() const override { return "/proc Sampler"; }
private:
  CpuCollector cpu_{};
  MemoryCollector mem_{};

  struct StatFields { uint64_t utime{}, stime{}, starttime{}; int64_t rss_pages{}; };
  static bool parse_stat_line(const std::string& content, StatFields& out);
  static std::optional<double> read_uptime_seconds();
  static std::string read_cmdline(int32_t pid);
};

} // namespace devmon::collectors
