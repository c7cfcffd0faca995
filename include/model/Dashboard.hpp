#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "model/Sample.hpp"

namespace devmon::model {

using Clock = std::chrono::steady_clock;

// Contiguous error/stack-trace lines, oldest first. Never empty when present.
struct ErrorBlock {
  std::vector<std::string> lines;

  [[nodiscard]] std::string joined() const {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
      if (i) out.push_back('\n');
      out += lines[i];
    }
    return out;
  }
};

// Transient footer message. Expiry is checked when read, never by deletion.
struct StatusMessage {
  std::string text;
  Clock::time_point created_at{};

  [[nodiscard]] bool visible(Clock::time_point now,
                             std::chrono::milliseconds ttl = std::chrono::seconds(5)) const {
    return now - created_at < ttl;
  }
};

struct ServiceRow {
  std::string name;
  std::optional<ProcessSample> sample; // nullopt: service is down
  std::string color;
};

// Everything a frame shows. Written only by the event loop.
struct DashboardState {
  uint64_t tick{};
  Clock::time_point updated_at{};
  std::vector<ServiceRow> services;
  SystemSample system;
  StorageSample storage;
  std::vector<std::string> log_tail;
  bool has_error{false};
  std::optional<StatusMessage> status;
};

} // namespace devmon::model
