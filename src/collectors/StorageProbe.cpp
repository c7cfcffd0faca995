#include "collectors/StorageProbe.hpp"

#include <filesystem>
#include <system_error>

namespace devmon::collectors {

devmon::model::StorageSample StorageProbe::sample() const {
  devmon::model::StorageSample s{};
  if (path_.empty()) return s;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec) || ec) return s;
  auto bytes = std::filesystem::file_size(path_, ec);
  if (ec) return s;
  s.exists = true;
  s.size_mb = static_cast<double>(bytes) / (1024.0 * 1024.0);
  return s;
}

} // namespace devmon::collectors
