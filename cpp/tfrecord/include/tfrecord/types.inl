#include "internal.hpp"

namespace tfrecord {

std::string_view CompressionString(Compression compression) {
  switch (compression) {
    case Compression::None:
    default:
      return std::string_view{};
    case Compression::Lz4:
      return "lz4";
    case Compression::Zstd:
      return "zstd";
  }
}

std::optional<Compression> ParseCompression(std::string_view compression) {
  if (compression == "" || compression == "none") {
    return Compression::None;
  } else if (compression == "lz4") {
    return Compression::Lz4;
  } else if (compression == "zstd") {
    return Compression::Zstd;
  }
  return std::nullopt;
}

TFRecord::TFRecord(ByteArray data, MaskedCrc dataCrc)
    : data_(std::move(data))
    , dataCrc_(dataCrc) {}

TFRecord TFRecord::FromData(ByteArray data) {
  const auto dataCrc = MaskedCrc::Compute(data.data(), data.size());
  return TFRecord{std::move(data), dataCrc};
}

const ByteArray& TFRecord::data() const {
  return data_;
}

MaskedCrc TFRecord::dataCrc() const {
  return dataCrc_;
}

Status TFRecord::validate() const {
  const auto got = MaskedCrc::Compute(data_.data(), data_.size());
  if (got != dataCrc_) {
    return Status::Mismatch(StatusCode::DataChecksumMismatch, ChecksumMismatch{got, dataCrc_});
  }
  return StatusCode::Success;
}

uint64_t TFRecord::recordSize() const {
  return HeaderLength + data_.size() + FooterLength;
}

}  // namespace tfrecord
