#include "minitest.hpp"
#include "app/LogTail.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_dir(const char* tag) {
  auto root = fs::temp_directory_path() / (std::string("devmon_test_tail_") + tag + "_" + std::to_string(::getpid()));
  fs::create_directories(root);
  return root;
}

TEST(tail_returns_all_lines_of_short_file) {
  auto p = make_dir("short") / "dev.log";
  std::ofstream(p) << "one\ntwo\nthree\nfour\nfive\n";
  auto got = devmon::app::tail_lines(p.string(), 18);
  ASSERT_EQ(got.size(), 5u);
  ASSERT_EQ(got.front(), std::string("one"));
  ASSERT_EQ(got.back(), std::string("five"));
}

TEST(tail_returns_last_lines_oldest_first) {
  auto p = make_dir("long") / "dev.log";
  {
    std::ofstream out(p);
    for (int i = 0; i < 1000; ++i) out << "line " << i << "\n";
  }
  auto got = devmon::app::tail_lines(p.string(), 18);
  ASSERT_EQ(got.size(), 18u);
  ASSERT_EQ(got.front(), std::string("line 982"));
  ASSERT_EQ(got.back(), std::string("line 999"));
}

TEST(tail_counts_unterminated_last_line) {
  auto p = make_dir("partial") / "dev.log";
  std::ofstream(p) << "a\nb\nhalf written";
  auto got = devmon::app::tail_lines(p.string(), 2);
  ASSERT_EQ(got.size(), 2u);
  ASSERT_EQ(got[0], std::string("b"));
  ASSERT_EQ(got[1], std::string("half written"));
  ASSERT_TRUE(devmon::app::tail_lines(p.string(), 0).empty());
}

TEST(tail_and_read_full_tolerate_missing_file) {
  auto p = make_dir("missing") / "absent.log";
  fs::remove(p);
  ASSERT_TRUE(devmon::app::tail_lines(p.string(), 18).empty());
  ASSERT_EQ(devmon::app::read_full(p.string()), std::string());
}

TEST(read_full_returns_whole_file) {
  auto p = make_dir("full") / "dev.log";
  std::ofstream(p, std::ios::binary) << "x\n\ty\nz";
  ASSERT_EQ(devmon::app::read_full(p.string()), std::string("x\n\ty\nz"));
}
