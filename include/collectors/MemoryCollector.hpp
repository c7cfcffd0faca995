#pragma once
#include <cstdint>

namespace devmon::collectors {

struct MemoryInfo {
  uint64_t total_kb{};
  uint64_t used_kb{};
};

class MemoryCollector {
public:
  bool sample(MemoryInfo& out) const; // returns true on success
};

} // namespace devmon::collectors
