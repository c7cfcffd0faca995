#include "collectors/CpuCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string_view>

namespace devmon::collectors {

static bool parse_cpu_line(std::string_view line, CpuTimes& out) {
  if (!line.starts_with("cpu ")) return false;
  std::string_view rest = line.substr(4);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end == start) break;
    std::from_chars(rest.data() + start, rest.data() + end, vals[i++]);
    start = end;
  }
  if (i < 4) return false; // user nice system idle are always present
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
  return true;
}

bool CpuCollector::sample(double& usage_pct) {
  auto txt = devmon::util::read_file_string("/proc/stat");
  if (!txt) return false;
  std::string_view all(*txt);
  auto nl = all.find('\n');
  CpuTimes now{};
  if (!parse_cpu_line(all.substr(0, nl), now)) return false;

  usage_pct = 0.0;
  if (has_last_) {
    uint64_t dt = now.total() > last_.total() ? now.total() - last_.total() : 0;
    uint64_t dw = now.work() > last_.work() ? now.work() - last_.work() : 0;
    if (dt > 0) usage_pct = 100.0 * static_cast<double>(dw) / static_cast<double>(dt);
    if (usage_pct > 100.0) usage_pct = 100.0;
  }
  last_ = now;
  has_last_ = true;
  return true;
}

} // namespace devmon::collectors
