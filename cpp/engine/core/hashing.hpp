#pragma once
/*
================================================================================
Fragment 1.5 — Core: Deterministic Hashing
FILE: cpp/engine/core/hashing.hpp

Purpose:
  - Stable 64-bit content identities for the report metadata:
      * input files (path + kind + bytes)
      * loaded rule sets (ids, conditions, citations, severities)

Design constraints:
  - Determinism > speed. No std::hash (not stable across processes/platforms).
  - Doubles hashed via bit pattern after canonicalization
    (-0.0 -> +0.0, NaN -> fixed quiet-NaN payload).

Notes:
  - This is NOT cryptographic. It is for identity and reproducibility.
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace rascheck {

struct Hash64 {
  std::uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

// FNV-1a 64.
class Fnv1a64 {
 public:
  static constexpr std::uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr std::uint64_t kPrime       = 1099511628211ull;

  Fnv1a64() : h_(kOffsetBasis) {}

  std::uint64_t value() const { return h_; }
  Hash64 digest() const { return Hash64{h_}; }

  void update_bytes(const void* data, std::size_t n);

  void update_u8(std::uint8_t v) { update_bytes(&v, 1); }
  void update_u64(std::uint64_t v) { update_le(v); }
  void update_bool(bool b) { update_u8(static_cast<std::uint8_t>(b ? 1 : 0)); }

  // Length-delimited so ("ab","c") and ("a","bc") differ.
  void update_string(std::string_view s);

  template <class E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
  void update_enum(E e) {
    update_u64(static_cast<std::uint64_t>(static_cast<std::underlying_type_t<E>>(e)));
  }

  void update_f64(double x);

 private:
  template <class T>
  void update_le(T v) {
    static_assert(std::is_integral_v<T> && sizeof(T) == 8, "update_le supports 64-bit integers only");
    std::array<std::uint8_t, sizeof(T)> b{};
    for (std::size_t i = 0; i < sizeof(T); ++i) {
      b[i] = static_cast<std::uint8_t>((static_cast<std::uint64_t>(v) >> (8 * i)) & 0xFFu);
    }
    update_bytes(b.data(), b.size());
  }

  std::uint64_t h_;
};

// One-shot hash of a byte string.
Hash64 hash_bytes(std::string_view bytes);

// Convenience: hex encoding for report keys.
std::string hash_to_hex(Hash64 h);

}  // namespace rascheck
