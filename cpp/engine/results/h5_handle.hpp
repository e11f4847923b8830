#pragma once
/*
================================================================================
Fragment 3.2 — Results: HDF5 Handle Ownership
FILE: cpp/engine/results/h5_handle.hpp

Purpose:
  - Scope ownership for HDF5 identifiers (file, group, dataset, datatype,
    dataspace, attribute, object). Every id opened by the reader lives in an
    H5Handle and is closed on every exit path.
  - hdf5_mutex(): the serial HDF5 library is not thread safe; every sequence
    of HDF5 calls runs under this lock.
================================================================================
*/

#include <hdf5.h>

#include <mutex>
#include <utility>

namespace rascheck::results {

class H5Handle {
 public:
  using Closer = herr_t (*)(hid_t);

  H5Handle() noexcept = default;
  H5Handle(hid_t id, Closer closer) noexcept : id_(id), closer_(closer) {}
  ~H5Handle() { reset(); }

  H5Handle(const H5Handle&) = delete;
  H5Handle& operator=(const H5Handle&) = delete;

  H5Handle(H5Handle&& o) noexcept : id_(std::exchange(o.id_, H5I_INVALID_HID)), closer_(o.closer_) {}
  H5Handle& operator=(H5Handle&& o) noexcept {
    if (this != &o) {
      reset();
      id_ = std::exchange(o.id_, H5I_INVALID_HID);
      closer_ = o.closer_;
    }
    return *this;
  }

  hid_t get() const noexcept { return id_; }
  bool valid() const noexcept { return id_ >= 0; }
  explicit operator bool() const noexcept { return valid(); }

  void reset() noexcept {
    if (id_ >= 0 && closer_) (void)closer_(id_);
    id_ = H5I_INVALID_HID;
  }

 private:
  hid_t id_ = H5I_INVALID_HID;
  Closer closer_ = nullptr;
};

inline H5Handle h5_file(hid_t id) noexcept { return H5Handle(id, &H5Fclose); }
inline H5Handle h5_group(hid_t id) noexcept { return H5Handle(id, &H5Gclose); }
inline H5Handle h5_dataset(hid_t id) noexcept { return H5Handle(id, &H5Dclose); }
inline H5Handle h5_type(hid_t id) noexcept { return H5Handle(id, &H5Tclose); }
inline H5Handle h5_space(hid_t id) noexcept { return H5Handle(id, &H5Sclose); }
inline H5Handle h5_attr(hid_t id) noexcept { return H5Handle(id, &H5Aclose); }
inline H5Handle h5_object(hid_t id) noexcept { return H5Handle(id, &H5Oclose); }
inline H5Handle h5_plist(hid_t id) noexcept { return H5Handle(id, &H5Pclose); }

std::mutex& hdf5_mutex();

// Silence the library's automatic error stack printing (once per process);
// failures are reported through return codes instead.
void hdf5_quiet();

} // namespace rascheck::results
