#include "collectors/ProcfsSampleProvider.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>
#include <cstdlib>
#include <sstream>

namespace devmon::collectors {

bool ProcfsSampleProvider::parse_stat_line(const std::string& content, StatFields& out) {
  // comm may contain spaces and parentheses; fields resume after the last ')'
  auto lp = content.find('('); auto rp = content.rfind(')');
  if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > content.size()) return false;
  std::istringstream ss(content.substr(rp + 2));
  char state = 0; ss >> state;
  std::string skip;
  // ppid pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
  for (int i = 0; i < 10; ++i) ss >> skip;
  ss >> out.utime >> out.stime;
  // cutime cstime priority nice num_threads itrealvalue
  for (int i = 0; i < 6; ++i) ss >> skip;
  ss >> out.starttime;
  unsigned long long vsize_bytes = 0;
  ss >> vsize_bytes;
  ss >> out.rss_pages;
  return static_cast<bool>(ss);
}

std::optional<double> ProcfsSampleProvider::read_uptime_seconds() {
  auto txt = devmon::util::read_file_string("/proc/uptime");
  if (!txt) return std::nullopt;
  char* end = nullptr;
  double up = std::strtod(txt->c_str(), &end);
  if (end == txt->c_str()) return std::nullopt;
  return up;
}

std::string ProcfsSampleProvider::read_cmdline(int32_t pid) {
  auto bytes = devmon::util::read_file_bytes(std::string("/proc/") + std::to_string(pid) + "/cmdline");
  if (!bytes) return {};
  std::string out; out.reserve(bytes->size()); bool sep = true;
  for (auto b : *bytes) {
    if (b == 0) { if (!sep) { out.push_back(' '); sep = true; } }
    else { out.push_back(static_cast<char>(b)); sep = false; }
  }
  if (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

std::optional<devmon::model::ProcessSample> ProcfsSampleProvider::sample_by_pid(int32_t pid) {
  if (pid <= 0) return std::nullopt;
  auto content = devmon::util::read_file_string(std::string("/proc/") + std::to_string(pid) + "/stat");
  if (!content) return std::nullopt;
  StatFields f{};
  if (!parse_stat_line(*content, f)) return std::nullopt;

  devmon::model::ProcessSample s{};
  long hz = ::sysconf(_SC_CLK_TCK);
  if (hz <= 0) hz = 100;
  if (auto up = read_uptime_seconds()) {
    double elapsed = *up - static_cast<double>(f.starttime) / static_cast<double>(hz);
    double cpu_secs = static_cast<double>(f.utime + f.stime) / static_cast<double>(hz);
    if (elapsed > 0.0) s.cpu_pct = 100.0 * cpu_secs / elapsed;
  }
  uint64_t rss_kb = f.rss_pages > 0 ? static_cast<uint64_t>(f.rss_pages) * static_cast<uint64_t>(::getpagesize() / 1024) : 0;
  s.resident_mb = static_cast<double>(rss_kb) / 1024.0;
  MemoryInfo mi{};
  if (mem_.sample(mi) && mi.total_kb > 0) {
    s.mem_pct = 100.0 * static_cast<double>(rss_kb) / static_cast<double>(mi.total_kb);
  }
  return s;
}

std::optional<int32_t> ProcfsSampleProvider::find_pid_by_pattern(const std::string& pattern) {
  if (pattern.empty()) return std::nullopt;
  const int32_t self = static_cast<int32_t>(::getpid());
  std::optional<int32_t> best;
  for (const auto& name : devmon::util::list_dir("/proc")) {
    if (name.empty() || name[0] < '0' || name[0] > '9') continue; // numeric
    int32_t pid = static_cast<int32_t>(std::strtol(name.c_str(), nullptr, 10));
    if (pid <= 0 || pid == self) continue;
    if (best && pid >= *best) continue;
    auto cmd = read_cmdline(pid);
    if (cmd.find(pattern) != std::string::npos) best = pid;
  }
  return best;
}

devmon::model::SystemSample ProcfsSampleProvider::system_sample() {
  devmon::model::SystemSample s{};
  MemoryInfo mi{};
  if (!mem_.sample(mi)) return s; // unknown
  double cpu = 0.0;
  if (cpu_.sample(cpu)) s.cpu_total_pct = cpu;
  s.mem_total_mb = mi.total_kb / 1024;
  s.mem_used_mb = mi.used_kb / 1024;
  if (s.mem_total_mb == 0) return devmon::model::SystemSample{};
  return s;
}

} // namespace devmon::collectors
