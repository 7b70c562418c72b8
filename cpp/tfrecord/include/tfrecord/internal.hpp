#pragma once

#include "types.hpp"
#include <array>
#include <cstring>
#include <limits>
#include <utility>

// Do not compile on systems with non-8-bit bytes
static_assert(std::numeric_limits<unsigned char>::digits == 8);

namespace tfrecord {

namespace internal {

inline std::string to_string(const std::string& arg) {
  return arg;
}
inline std::string to_string(std::string_view arg) {
  return std::string(arg);
}
inline std::string to_string(const char* arg) {
  return std::string(arg);
}
inline std::string to_string(const MaskedCrc& arg) {
  return arg.toString();
}
template <typename... T>
[[nodiscard]] inline std::string StrCat(T&&... args) {
  using std::to_string;
  using tfrecord::internal::to_string;
  return ("" + ... + to_string(std::forward<T>(args)));
}

inline uint32_t ParseUint32(const std::byte* data) {
  return uint32_t(data[0]) | (uint32_t(data[1]) << 8) | (uint32_t(data[2]) << 16) |
         (uint32_t(data[3]) << 24);
}

inline uint64_t ParseUint64(const std::byte* data) {
  return uint64_t(data[0]) | (uint64_t(data[1]) << 8) | (uint64_t(data[2]) << 16) |
         (uint64_t(data[3]) << 24) | (uint64_t(data[4]) << 32) | (uint64_t(data[5]) << 40) |
         (uint64_t(data[6]) << 48) | (uint64_t(data[7]) << 56);
}

inline void WriteUint64(std::byte* output, uint64_t value) {
  for (size_t i = 0; i < 8; i++) {
    output[i] = std::byte((value >> (8 * i)) & 0xff);
  }
}

/**
 * Encode the fixed-size header preceding a record's data: the little-endian length followed by
 * the masked CRC of those 8 length bytes.
 */
inline std::array<std::byte, HeaderLength> EncodeHeader(uint64_t length) {
  std::array<std::byte, HeaderLength> header{};
  WriteUint64(header.data(), length);
  const auto lengthCrc = MaskedCrc::Compute(header.data(), LengthCrcOffset).toBytes();
  std::memcpy(header.data() + LengthCrcOffset, lengthCrc.data(), lengthCrc.size());
  return header;
}

}  // namespace internal

}  // namespace tfrecord
