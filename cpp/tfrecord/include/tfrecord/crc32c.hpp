#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace tfrecord::internal {

/**
 * Slicing-by-N lookup tables for a reflected CRC-32 polynomial.
 *
 * Table 0 holds the CRC of every single byte value. Table k holds the CRC of that byte followed by
 * k zero bytes, which lets N input bytes be folded into the running CRC with N independent lookups
 * XORed together.
 *
 * @param Polynomial Reflected polynomial, with the x^0 coefficient in the most significant bit.
 * @param NumTables Number of input bytes consumed per step of the fast loop.
 */
template <uint32_t Polynomial, size_t NumTables>
struct CRC32Table {
  constexpr CRC32Table() {
    for (uint32_t byte = 0; byte < 256; byte++) {
      uint32_t crc = byte;
      for (int bit = 0; bit < 8; bit++) {
        crc = (crc >> 1) ^ (Polynomial & (0u - (crc & 1)));
      }
      entries_[byte] = crc;
    }
    // Each further table appends one zero byte to the previous one
    for (size_t k = 1; k < NumTables; k++) {
      for (size_t byte = 0; byte < 256; byte++) {
        const uint32_t prev = entries_[(k - 1) * 256 + byte];
        entries_[k * 256 + byte] = entries_[prev & 0xff] ^ (prev >> 8);
      }
    }
  }

  constexpr uint32_t operator[](size_t index) const {
    return entries_[index];
  }

private:
  std::array<uint32_t, 256 * NumTables> entries_ = {};
};

inline uint32_t getUint32LE(const std::byte* data) {
  return (uint32_t(data[0]) << 0) | (uint32_t(data[1]) << 8) | (uint32_t(data[2]) << 16) |
         (uint32_t(data[3]) << 24);
}

/** Reversed Castagnoli polynomial (CRC-32C, as used by iSCSI, LevelDB and TFRecord). */
constexpr uint32_t CRC32C_POLYNOMIAL = 0x82f63b78;

static constexpr CRC32Table<CRC32C_POLYNOMIAL, 8> CRC32C_TABLE;

/**
 * Initialize a CRC32C to all 1 bits.
 */
static constexpr uint32_t CRC32C_INIT = 0xffffffff;

/**
 * Update a streaming CRC32C calculation.
 *
 * Unaligned leading bytes and the tail are handled one byte at a time; everything in between goes
 * through the slicing-by-8 loop.
 */
inline uint32_t crc32cUpdate(const uint32_t prev, const std::byte* const data,
                             const size_t length) {
  uint32_t r = prev;
  size_t offset = 0;
  for (; (uintptr_t(data + offset) % alignof(uint32_t)) != 0 && offset < length; offset++) {
    r = CRC32C_TABLE[(r ^ uint8_t(data[offset])) & 0xff] ^ (r >> 8);
  }
  if (offset == length) {
    return r;
  }

  size_t remainingBytes = length - offset;
  for (; remainingBytes >= 8; offset += 8, remainingBytes -= 8) {
    r ^= getUint32LE(data + offset);
    uint32_t r2 = getUint32LE(data + offset + 4);
    r = CRC32C_TABLE[0 * 256 + ((r2 >> 24) & 0xff)] ^ CRC32C_TABLE[1 * 256 + ((r2 >> 16) & 0xff)] ^
        CRC32C_TABLE[2 * 256 + ((r2 >> 8) & 0xff)] ^ CRC32C_TABLE[3 * 256 + ((r2 >> 0) & 0xff)] ^
        CRC32C_TABLE[4 * 256 + ((r >> 24) & 0xff)] ^ CRC32C_TABLE[5 * 256 + ((r >> 16) & 0xff)] ^
        CRC32C_TABLE[6 * 256 + ((r >> 8) & 0xff)] ^ CRC32C_TABLE[7 * 256 + ((r >> 0) & 0xff)];
  }

  for (; offset < length; offset++) {
    r = CRC32C_TABLE[(r ^ uint8_t(data[offset])) & 0xff] ^ (r >> 8);
  }
  return r;
}

/** Finalize a CRC32C by inverting the output value. */
inline uint32_t crc32cFinal(uint32_t crc) {
  return crc ^ 0xffffffff;
}

/** Compute the CRC32C of a whole buffer in one call. */
inline uint32_t crc32c(const std::byte* data, size_t length) {
  return crc32cFinal(crc32cUpdate(CRC32C_INIT, data, length));
}

}  // namespace tfrecord::internal
