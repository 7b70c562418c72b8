#pragma once

#include "crc32c.hpp"
#include "visibility.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace tfrecord {

/**
 * @brief A CRC-32C (Castagnoli) checksum after the LevelDB masking permutation.
 *
 * This is the checksum format used by TFRecord length and data fields. The raw CRC is rotated
 * right by 15 bits and offset by a constant, so that computing the CRC of a buffer which itself
 * contains embedded CRCs does not produce degenerate values.
 */
class TFRECORD_PUBLIC MaskedCrc {
public:
  /** Added to the rotated CRC when masking. */
  static constexpr uint32_t MaskDelta = 0xa282ead8;

  constexpr MaskedCrc() = default;
  constexpr explicit MaskedCrc(uint32_t value)
      : value_(value) {}

  /**
   * @brief Compute the masked CRC-32C of a buffer. Any length is valid, including zero.
   */
  static MaskedCrc Compute(const std::byte* data, uint64_t size) {
    return Mask(internal::crc32c(data, size_t(size)));
  }
  static MaskedCrc Compute(std::string_view data) {
    return Compute(reinterpret_cast<const std::byte*>(data.data()), data.size());
  }

  /**
   * @brief Apply the masking permutation to a raw (unmasked) CRC-32C.
   */
  static constexpr MaskedCrc Mask(uint32_t crc) {
    return MaskedCrc{((crc >> 15) | (crc << 17)) + MaskDelta};
  }

  /**
   * @brief Decode a masked CRC stored as 4 little-endian bytes.
   */
  static MaskedCrc FromBytes(const std::byte* data) {
    return MaskedCrc{internal::getUint32LE(data)};
  }

  /**
   * @brief Recover the raw CRC-32C this value was masked from.
   */
  constexpr uint32_t unmask() const {
    const uint32_t rotated = value_ - MaskDelta;
    return (rotated >> 17) | (rotated << 15);
  }

  constexpr uint32_t value() const {
    return value_;
  }

  /** Little-endian encoding, as stored on the wire. */
  std::array<std::byte, 4> toBytes() const {
    return {std::byte(value_ & 0xff), std::byte((value_ >> 8) & 0xff),
            std::byte((value_ >> 16) & 0xff), std::byte((value_ >> 24) & 0xff)};
  }

  /** Zero-padded lowercase hex, e.g. "0x00000123". */
  std::string toString() const {
    std::string result = "0x00000000";
    for (size_t i = 0; i < 8; i++) {
      result[9 - i] = "0123456789abcdef"[(value_ >> (4 * i)) & 0x0f];
    }
    return result;
  }

  /** e.g. "MaskedCrc(0x00000123)". */
  std::string debugString() const {
    return "MaskedCrc(" + toString() + ")";
  }

  friend constexpr bool operator==(const MaskedCrc& a, const MaskedCrc& b) {
    return a.value_ == b.value_;
  }
  friend constexpr bool operator!=(const MaskedCrc& a, const MaskedCrc& b) {
    return a.value_ != b.value_;
  }

private:
  uint32_t value_ = 0;
};

inline std::ostream& operator<<(std::ostream& os, const MaskedCrc& crc) {
  return os << crc.toString();
}

}  // namespace tfrecord
