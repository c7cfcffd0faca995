#include "app/LogTail.hpp"

#include <deque>
#include <fstream>
#include <iterator>

namespace devmon::app {

std::vector<std::string> tail_lines(const std::string& path, size_t max_lines) {
  if (max_lines == 0) return {};
  std::ifstream in(path);
  if (!in) return {};
  std::deque<std::string> ring;
  std::string line;
  while (std::getline(in, line)) {
    if (ring.size() == max_lines) ring.pop_front();
    ring.push_back(std::move(line));
    line.clear();
  }
  if (in.bad()) return {};
  return {std::make_move_iterator(ring.begin()), std::make_move_iterator(ring.end())};
}

std::string read_full(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return {};
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) return {};
  return s;
}

} // namespace devmon::app
