#include "minitest.hpp"
#include "collectors/CpuCollector.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_root_cpu(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("devmon_test_cpu_") + tag + "_" + std::to_string(::getpid()));
  fs::create_directories(root / "proc");
  return root;
}

TEST(cpu_collector_delta_usage) {
  auto root = make_root_cpu("delta");
  std::ofstream(root / "proc/stat") << "cpu  100 0 100 1000 0 0 0 0\n"
                                        "cpu0 100 0 100 1000 0 0 0 0\n";
  setenv("DEVMON_PROC_ROOT", root.c_str(), 1);
  devmon::collectors::CpuCollector c; double pct = -1.0;
  ASSERT_TRUE(c.sample(pct));
  ASSERT_NEAR(pct, 0.0, 1e-9); // no previous sample
  // 100 more busy jiffies out of 200 total
  std::ofstream(root / "proc/stat") << "cpu  150 0 150 1100 0 0 0 0\n"
                                        "cpu0 150 0 150 1100 0 0 0 0\n";
  ASSERT_TRUE(c.sample(pct));
  ASSERT_NEAR(pct, 50.0, 0.01);
  unsetenv("DEVMON_PROC_ROOT");
}

TEST(cpu_collector_short_line_and_missing_file) {
  auto root = make_root_cpu("short");
  setenv("DEVMON_PROC_ROOT", root.c_str(), 1);
  devmon::collectors::CpuCollector c; double pct = 0.0;
  ASSERT_FALSE(c.sample(pct));
  // Older kernels report only four columns
  std::ofstream(root / "proc/stat") << "cpu  10 0 10 80\n";
  ASSERT_TRUE(c.sample(pct));
  std::ofstream(root / "proc/stat") << "cpu  20 0 20 140\n";
  ASSERT_TRUE(c.sample(pct));
  ASSERT_NEAR(pct, 25.0, 0.01);
  unsetenv("DEVMON_PROC_ROOT");
}
