#include "engine/results/result_types.hpp"

#include <limits>

namespace rascheck::results {

double RawDataset::at(std::size_t r, std::size_t c) const noexcept {
  if (shape.size() != 2 || r >= shape[0] || c >= shape[1]) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const std::size_t i = r * shape[1] + c;
  return i < numbers.size() ? numbers[i] : std::numeric_limits<double>::quiet_NaN();
}

const RawDataset* ParsedResultFile::find(const std::string& path) const noexcept {
  for (const auto& d : datasets) {
    if (d.path == path) return &d;
  }
  return nullptr;
}

} // namespace rascheck::results
