#pragma once
#include <string>
#include "model/Sample.hpp"

namespace devmon::collectors {

class StorageProbe {
public:
  explicit StorageProbe(std::string path) : path_(std::move(path)) {}
  // Stats the file without opening it. Missing or unreadable -> exists=false.
  [[nodiscard]] devmon::model::StorageSample sample() const;
  [[nodiscard]] const std::string& path() const { return path_; }
private:
  std::string path_;
};

} // namespace devmon::collectors
