// Deterministic hashing for search-state keys.

#ifndef AKKORDIO_CORE_STABLE_HASH_H
#define AKKORDIO_CORE_STABLE_HASH_H

#include <cstddef>
#include <cstdint>

namespace akkordio {

/// @brief Incremental FNV-1a 64-bit hasher.
///
/// std::hash is implementation-defined; search ordering must not depend on
/// the standard library, so state keys are hashed with FNV-1a.
class StableHash {
 public:
  static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr uint64_t kPrime = 1099511628211ull;

  /// @brief Mix one byte.
  void addByte(uint8_t byte) {
    hash_ ^= byte;
    hash_ *= kPrime;
  }

  /// @brief Mix a 32-bit value, little-endian byte order.
  void addU32(uint32_t val) {
    for (int shift = 0; shift < 32; shift += 8) {
      addByte(static_cast<uint8_t>((val >> shift) & 0xFFu));
    }
  }

  /// @brief Mix a signed 32-bit value.
  void addI32(int32_t val) { addU32(static_cast<uint32_t>(val)); }

  uint64_t value() const { return hash_; }

  /// @brief Hash a byte range in one call.
  static uint64_t ofBytes(const uint8_t* data, size_t size) {
    StableHash hasher;
    for (size_t idx = 0; idx < size; ++idx) hasher.addByte(data[idx]);
    return hasher.value();
  }

 private:
  uint64_t hash_ = kOffsetBasis;
};

}  // namespace akkordio

#endif  // AKKORDIO_CORE_STABLE_HASH_H
