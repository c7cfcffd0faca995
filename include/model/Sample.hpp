#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace devmon::model {

// Point-in-time resource usage of one process.
struct ProcessSample {
  double cpu_pct{};     // lifetime share, ps(1) style; may exceed 100 on SMP
  double mem_pct{};     // RSS / MemTotal, 0..100
  double resident_mb{}; // RSS in MiB
};

// Machine-wide usage. mem_total_mb == 0 means the query failed ("unknown").
struct SystemSample {
  double   cpu_total_pct{};
  uint64_t mem_used_mb{};
  uint64_t mem_total_mb{};

  [[nodiscard]] bool known() const { return mem_total_mb > 0; }
  [[nodiscard]] double mem_pct() const {
    return known() ? 100.0 * static_cast<double>(mem_used_mb) / static_cast<double>(mem_total_mb) : 0.0;
  }
};

// Existence/size probe of a file that is never opened.
struct StorageSample {
  bool   exists{false};
  double size_mb{0.0};
};

// One monitored service: located by a fixed pid or by a cmdline pattern.
struct ServiceSpec {
  std::string name;
  std::optional<int32_t> pid;
  std::string pattern;
  std::string color;   // name colour while running; empty means green
};

} // namespace devmon::model
