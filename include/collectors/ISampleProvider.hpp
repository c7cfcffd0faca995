#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "model/Sample.hpp"

namespace devmon::collectors {

// Synchronous source of process and machine samples. Implementations never
// throw for an unavailable process or file; they report absence instead.
class ISampleProvider {
public:
  virtual ~ISampleProvider() = default;

  // nullopt when the process does not exist or cannot be read.
  [[nodiscard]] virtual std::optional<devmon::model::ProcessSample> sample_by_pid(int32_t pid) = 0;

  // First (lowest) pid whose command line contains pattern; nullopt if none.
  [[nodiscard]] virtual std::optional<int32_t> find_pid_by_pattern(const std::string& pattern) = 0;

  // Zero-valued (unknown) sample when the system query fails.
  [[nodiscard]] virtual devmon::model::SystemSample system_sample() = 0;

  // Optional: human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace devmon::collectors
