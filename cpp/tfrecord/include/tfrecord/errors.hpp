#pragma once

#include "masked_crc.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace tfrecord {

/**
 * @brief Status codes for TFRecord readers and writers.
 */
enum class StatusCode {
  Success = 0,
  Truncated,
  LengthChecksumMismatch,
  DataChecksumMismatch,
  RecordTooLarge,
  ReadFailed,
  WriteFailed,
  OpenFailed,
  NotOpen,
  DecompressionFailed,
  CompressionFailed,
  UnsupportedCompression,
  InvalidReadOptions,
};

/**
 * @brief A checksum was computed over a buffer, but did not match the value stored alongside it.
 */
struct TFRECORD_PUBLIC ChecksumMismatch {
  /** The checksum computed from the bytes that were read. */
  MaskedCrc got;
  /** The checksum stored in the record. */
  MaskedCrc want;

  std::string toString() const {
    return "got " + got.toString() + ", want " + want.toString();
  }

  friend bool operator==(const ChecksumMismatch& a, const ChecksumMismatch& b) {
    return a.got == b.got && a.want == b.want;
  }
  friend bool operator!=(const ChecksumMismatch& a, const ChecksumMismatch& b) {
    return !(a == b);
  }
};

/**
 * @brief Wraps a status code and string message carrying additional context.
 */
struct [[nodiscard]] Status {
  StatusCode code;
  std::string message;
  /**
   * @brief Computed and stored checksums. Set for `LengthChecksumMismatch` and
   * `DataChecksumMismatch`.
   */
  std::optional<ChecksumMismatch> checksum;
  /**
   * @brief The raw length field of the offending record. Set for `RecordTooLarge`.
   */
  std::optional<uint64_t> recordLength;

  Status()
      : code(StatusCode::Success) {}

  Status(StatusCode _code)
      : code(_code) {
    switch (code) {
      case StatusCode::Success:
        break;
      case StatusCode::Truncated:
        message = "record truncated";
        break;
      case StatusCode::LengthChecksumMismatch:
        message = "length checksum mismatch";
        break;
      case StatusCode::DataChecksumMismatch:
        message = "checksum mismatch";
        break;
      case StatusCode::RecordTooLarge:
        message = "record too large to fit in memory";
        break;
      case StatusCode::ReadFailed:
        message = "read failed";
        break;
      case StatusCode::WriteFailed:
        message = "write failed";
        break;
      case StatusCode::OpenFailed:
        message = "open failed";
        break;
      case StatusCode::NotOpen:
        message = "not open";
        break;
      case StatusCode::DecompressionFailed:
        message = "decompression failed";
        break;
      case StatusCode::CompressionFailed:
        message = "compression failed";
        break;
      case StatusCode::UnsupportedCompression:
        message = "unsupported compression";
        break;
      case StatusCode::InvalidReadOptions:
        message = "invalid read options";
        break;
      default:
        message = "unknown";
        break;
    }
  }

  Status(StatusCode _code, const std::string& _message)
      : code(_code)
      , message(_message) {}

  /**
   * @brief A `LengthChecksumMismatch` or `DataChecksumMismatch` status carrying both checksums.
   */
  static Status Mismatch(StatusCode code, const ChecksumMismatch& mismatch) {
    Status status{code};
    status.message += ": " + mismatch.toString();
    status.checksum = mismatch;
    return status;
  }

  /**
   * @brief A `RecordTooLarge` status carrying the record's length field.
   */
  static Status TooLarge(uint64_t length) {
    Status status{StatusCode::RecordTooLarge};
    status.message += " (" + std::to_string(length) + " bytes)";
    status.recordLength = length;
    return status;
  }

  bool ok() const {
    return code == StatusCode::Success;
  }
};

}  // namespace tfrecord
