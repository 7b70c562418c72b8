#pragma once

#include "errors.hpp"
#include "masked_crc.hpp"
#include "visibility.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tfrecord {

#define TFRECORD_LIBRARY_VERSION "0.1.0"

using ByteArray = std::vector<std::byte>;
using ProblemCallback = std::function<void(const Status&)>;

constexpr char LibraryVersion[] = TFRECORD_LIBRARY_VERSION;

// Format of a single record:
//  uint64    length
//  uint32    masked crc of length
//  byte      data[length]
//  uint32    masked crc of data
constexpr size_t LengthCrcOffset = 8;
constexpr size_t HeaderLength = LengthCrcOffset + 4;
constexpr size_t FooterLength = 4;

/**
 * @brief Stream-level compression wrapping an entire TFRecord file.
 */
enum struct Compression {
  None,
  Lz4,
  Zstd,
};

/**
 * @brief Compression level to use when compression is enabled. Slower generally
 * produces smaller files, at the expense of more CPU time. These levels map to
 * different internal settings for each compression algorithm.
 */
enum struct CompressionLevel {
  Fastest,
  Fast,
  Default,
  Slow,
  Slowest,
};

/**
 * @brief Get the string representation of a Compression ("", "lz4", "zstd").
 */
TFRECORD_PUBLIC
std::string_view CompressionString(Compression compression);

/**
 * @brief Converts a compression string ("", "none", "lz4", "zstd") to the Compression enum.
 */
TFRECORD_PUBLIC
std::optional<Compression> ParseCompression(std::string_view compression);

/**
 * @brief A TFRecord payload together with the data checksum that was stored after it. The
 * checksum may or may not match the actual contents; call `validate()` to find out.
 */
class TFRECORD_PUBLIC TFRecord {
public:
  TFRecord() = default;
  TFRecord(ByteArray data, MaskedCrc dataCrc);

  /**
   * @brief Build a record whose stored checksum is computed from `data`.
   */
  static TFRecord FromData(ByteArray data);

  /**
   * @brief The payload bytes.
   */
  const ByteArray& data() const;
  /**
   * @brief The data checksum read from the stream (or computed by `FromData()`).
   */
  MaskedCrc dataCrc() const;

  /**
   * @brief Recompute the masked CRC of the payload and compare it to the stored checksum. Returns
   * `DataChecksumMismatch`, with `Status::checksum` populated, if they differ. This never caches;
   * every call recomputes from the payload.
   */
  Status validate() const;

  /**
   * @brief Size of this record in its serialized form, including header and footer.
   */
  uint64_t recordSize() const;

private:
  ByteArray data_;
  MaskedCrc dataCrc_;
};

}  // namespace tfrecord

#ifdef TFRECORD_IMPLEMENTATION
#  include "types.inl"
#endif
