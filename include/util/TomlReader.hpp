#pragma once

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devmon::util {

// Reader for the flat TOML subset devmon uses: [section] headers,
// key = value pairs, "quoted" strings, integers, booleans and # comments.
// Sections keep file order so [service.*] blocks list in the order written.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current = std::string(trim(sv.substr(1, sv.size() - 2)));
        section(current);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val = unquote(trim(sv.substr(eq + 1)));
      if (!key.empty()) section(current).set(key, std::move(val));
    }
    return true;
  }

  [[nodiscard]] bool has(std::string_view sec, std::string_view key) const {
    const auto* s = find(sec);
    return s && s->find(key) != nullptr;
  }

  [[nodiscard]] std::string get_string(std::string_view sec, std::string_view key,
                                       const std::string& def = "") const {
    const auto* s = find(sec);
    if (!s) return def;
    const auto* v = s->find(key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view sec, std::string_view key, int def = 0) const {
    auto val = get_string(sec, key);
    if (val.empty()) return def;
    try {
      size_t used = 0;
      int v = std::stoi(val, &used);
      return used == val.size() ? v : def;
    } catch (const std::exception&) {
      return def;
    }
  }

  [[nodiscard]] bool get_bool(std::string_view sec, std::string_view key, bool def = false) const {
    auto val = get_string(sec, key);
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  // Names of sections starting with prefix, in file order.
  [[nodiscard]] std::vector<std::string> sections_with_prefix(std::string_view prefix) const {
    std::vector<std::string> out;
    for (const auto& [name, _] : sections_)
      if (name.starts_with(prefix)) out.push_back(name);
    return out;
  }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] const std::string* find(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return &v;
      return nullptr;
    }

    void set(const std::string& key, std::string val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = std::move(val); return; }
      }
      entries.emplace_back(key, std::move(val));
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;

  Section& section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  // Quoted values keep everything between the quotes; bare values drop a trailing # comment.
  static std::string unquote(std::string_view sv) {
    if (sv.size() >= 2 && sv.front() == '"') {
      auto close = sv.find('"', 1);
      if (close != std::string_view::npos) return std::string(sv.substr(1, close - 1));
    }
    auto hash = sv.find('#');
    if (hash != std::string_view::npos) sv = trim(sv.substr(0, hash));
    return std::string(sv);
  }
};

} // namespace devmon::util
