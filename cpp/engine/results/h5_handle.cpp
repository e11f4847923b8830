#include "engine/results/h5_handle.hpp"

namespace rascheck::results {

std::mutex& hdf5_mutex() {
  static std::mutex m;
  return m;
}

void hdf5_quiet() {
  static std::once_flag once;
  std::call_once(once, [] { (void)H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr); });
}

} // namespace rascheck::results
