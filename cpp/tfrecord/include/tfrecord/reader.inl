#include "internal.hpp"
#include <algorithm>
#include <cerrno>
#include <new>
#include <stdexcept>
#ifndef TFRECORD_COMPRESSION_NO_LZ4
#  include <lz4frame.h>
#endif
#ifndef TFRECORD_COMPRESSION_NO_ZSTD
#  include <zstd.h>
#  include <zstd_errors.h>
#endif

namespace tfrecord {

namespace internal {

constexpr uint64_t CompressedInputBlockSize = 64 * 1024;
constexpr uint64_t DataReadChunkSize = 64 * 1024;

/**
 * Fill `buffer` from `*filled` up to `target` bytes, or fail with Truncated if the source runs dry
 * first. `*filled` is advanced by every byte obtained, including on failure.
 */
Status ReadRemaining(IByteSource& source, std::byte* buffer, uint64_t target, uint64_t* filled) {
  while (*filled < target) {
    uint64_t bytesRead = 0;
    const auto status = source.read(buffer + *filled, target - *filled, &bytesRead);
    *filled += std::min(bytesRead, target - *filled);
    if (!status.ok()) {
      return status;
    }
    if (bytesRead == 0) {
      return StatusCode::Truncated;
    }
  }
  return StatusCode::Success;
}

}  // namespace internal

// FileSource //////////////////////////////////////////////////////////////////

FileSource::FileSource(std::FILE* file)
    : file_(file) {}

Status FileSource::read(std::byte* output, uint64_t size, uint64_t* bytesRead) {
  *bytesRead = uint64_t(std::fread(output, 1, size_t(size), file_));
  if (*bytesRead < size) {
    if (std::ferror(file_)) {
      const int err = errno;
      std::clearerr(file_);
      const auto msg = internal::StrCat("failed to read ", size, " bytes: ", std::strerror(err));
      return Status{StatusCode::ReadFailed, msg};
    }
    // A writer may still be appending; forget that EOF was seen
    std::clearerr(file_);
  }
  return StatusCode::Success;
}

// StreamSource ////////////////////////////////////////////////////////////////

StreamSource::StreamSource(std::istream& stream)
    : stream_(stream) {}

Status StreamSource::read(std::byte* output, uint64_t size, uint64_t* bytesRead) {
  stream_.read(reinterpret_cast<char*>(output), std::streamsize(size));
  *bytesRead = uint64_t(stream_.gcount());
  if (stream_.bad()) {
    stream_.clear();
    const auto msg = internal::StrCat("stream error after reading ", *bytesRead, " of ", size,
                                      " bytes");
    return Status{StatusCode::ReadFailed, msg};
  }
  if (stream_.eof()) {
    stream_.clear();
  } else if (stream_.fail()) {
    return Status{StatusCode::ReadFailed, "stream is in a failed state"};
  }
  return StatusCode::Success;
}

// BufferSource ////////////////////////////////////////////////////////////////

BufferSource::BufferSource(const std::byte* data, uint64_t size)
    : data_(data)
    , size_(size)
    , offset_(0) {}

void BufferSource::reset(const std::byte* data, uint64_t size) {
  data_ = data;
  size_ = size;
  offset_ = 0;
}

Status BufferSource::read(std::byte* output, uint64_t size, uint64_t* bytesRead) {
  *bytesRead = 0;
  if (!data_ || offset_ >= size_) {
    return StatusCode::Success;
  }

  const auto available = std::min(size, size_ - offset_);
  std::memcpy(output, data_ + offset_, size_t(available));
  offset_ += available;
  *bytesRead = available;
  return StatusCode::Success;
}

uint64_t BufferSource::offset() const {
  return offset_;
}

// ICompressedSource ///////////////////////////////////////////////////////////

ICompressedSource::ICompressedSource(IByteSource& input)
    : input_(input)
    , inputBuffer_(internal::CompressedInputBlockSize) {}

Status ICompressedSource::fillInput(uint64_t* bytesRead) {
  inputPos_ = 0;
  inputSize_ = 0;
  const auto status = input_.read(inputBuffer_.data(), inputBuffer_.size(), bytesRead);
  inputSize_ = std::min<uint64_t>(*bytesRead, inputBuffer_.size());
  return status;
}

// ZStdSource //////////////////////////////////////////////////////////////////

#ifndef TFRECORD_COMPRESSION_NO_ZSTD
ZStdSource::ZStdSource(IByteSource& input)
    : ICompressedSource(input)
    , zstdContext_(ZSTD_createDCtx()) {}

ZStdSource::~ZStdSource() {
  ZSTD_freeDCtx(zstdContext_);
}

Status ZStdSource::read(std::byte* output, uint64_t size, uint64_t* bytesRead) {
  *bytesRead = 0;
  if (!zstdContext_) {
    return Status{StatusCode::DecompressionFailed, "failed to create zstd decompression context"};
  }

  while (*bytesRead < size) {
    ZSTD_inBuffer in{inputBuffer_.data(), size_t(inputSize_), size_t(inputPos_)};
    ZSTD_outBuffer out{output, size_t(size), size_t(*bytesRead)};
    const size_t result = ZSTD_decompressStream(zstdContext_, &out, &in);
    if (ZSTD_isError(result)) {
      const auto msg =
        internal::StrCat("zstd decompression failed with error ", ZSTD_getErrorName(result));
      return Status{StatusCode::DecompressionFailed, msg};
    }
    const bool progressed = out.pos > *bytesRead || in.pos > inputPos_;
    inputPos_ = in.pos;
    *bytesRead = out.pos;
    if (*bytesRead == size) {
      break;
    }

    if (inputPos_ == inputSize_) {
      uint64_t filled = 0;
      if (auto status = fillInput(&filled); !status.ok()) {
        return status;
      }
      if (filled == 0) {
        break;
      }
    } else if (!progressed) {
      break;
    }
  }
  return StatusCode::Success;
}
#endif

// LZ4Source ///////////////////////////////////////////////////////////////////

#ifndef TFRECORD_COMPRESSION_NO_LZ4
LZ4Source::LZ4Source(IByteSource& input)
    : ICompressedSource(input) {
  const LZ4F_errorCode_t err =
    LZ4F_createDecompressionContext((LZ4F_dctx**)&decompressionContext_, LZ4F_VERSION);
  if (LZ4F_isError(err)) {
    const auto msg =
      internal::StrCat("failed to create lz4 decompression context: ", LZ4F_getErrorName(err));
    status_ = Status{StatusCode::DecompressionFailed, msg};
    decompressionContext_ = nullptr;
  }
}

LZ4Source::~LZ4Source() {
  if (decompressionContext_) {
    LZ4F_freeDecompressionContext((LZ4F_dctx*)decompressionContext_);
  }
}

Status LZ4Source::read(std::byte* output, uint64_t size, uint64_t* bytesRead) {
  *bytesRead = 0;
  if (!decompressionContext_) {
    return status_;
  }

  while (*bytesRead < size) {
    size_t dstSize = size_t(size - *bytesRead);
    size_t srcSize = size_t(inputSize_ - inputPos_);
    const size_t result =
      LZ4F_decompress((LZ4F_dctx*)decompressionContext_, output + *bytesRead, &dstSize,
                      inputBuffer_.data() + inputPos_, &srcSize, nullptr);
    if (LZ4F_isError(result)) {
      const auto msg = internal::StrCat("lz4 decompression failed with error ", (int)result, " (",
                                        LZ4F_getErrorName(result), ")");
      return Status{StatusCode::DecompressionFailed, msg};
    }
    const bool progressed = dstSize > 0 || srcSize > 0;
    inputPos_ += srcSize;
    *bytesRead += dstSize;
    if (*bytesRead == size) {
      break;
    }

    if (inputPos_ == inputSize_) {
      uint64_t filled = 0;
      if (auto status = fillInput(&filled); !status.ok()) {
        return status;
      }
      if (filled == 0) {
        break;
      }
    } else if (!progressed) {
      break;
    }
  }
  return StatusCode::Success;
}
#endif

// TFRecordState ///////////////////////////////////////////////////////////////

Status TFRecordState::readRecord(IByteSource& source, TFRecord* record) {
  if (phase_ == ReadPhase::Header) {
    if (auto status = readHeader_(source); !status.ok()) {
      return status;
    }
  }

  // Grow the buffer only as far as each read can fill, so polling a pending record costs no more
  // than the bytes that arrive. Capacity was reserved when the header was accepted.
  const uint64_t target = dataLength_ + FooterLength;
  while (dataAndFooter_.size() < target) {
    const uint64_t filled = dataAndFooter_.size();
    const uint64_t chunk = std::min(target - filled, internal::DataReadChunkSize);
    dataAndFooter_.resize(size_t(filled + chunk));
    uint64_t bytesRead = 0;
    const auto status = source.read(dataAndFooter_.data() + filled, chunk, &bytesRead);
    dataAndFooter_.resize(size_t(filled + std::min(bytesRead, chunk)));
    if (!status.ok()) {
      return status;
    }
    if (bytesRead == 0) {
      return StatusCode::Truncated;
    }
  }

  const auto dataCrc = MaskedCrc::FromBytes(dataAndFooter_.data() + dataLength_);
  dataAndFooter_.resize(size_t(dataLength_));
  *record = TFRecord{std::move(dataAndFooter_), dataCrc};

  // Ready for the next record
  dataAndFooter_ = ByteArray{};
  headerSize_ = 0;
  dataLength_ = 0;
  phase_ = ReadPhase::Header;
  return StatusCode::Success;
}

Status TFRecordState::readHeader_(IByteSource& source) {
  if (auto status = internal::ReadRemaining(source, header_.data(), HeaderLength, &headerSize_);
      !status.ok()) {
    return status;
  }

  const auto want = MaskedCrc::FromBytes(header_.data() + LengthCrcOffset);
  const auto got = MaskedCrc::Compute(header_.data(), LengthCrcOffset);
  if (got != want) {
    return Status::Mismatch(StatusCode::LengthChecksumMismatch, ChecksumMismatch{got, want});
  }

  const uint64_t length = internal::ParseUint64(header_.data());
  if (length > std::numeric_limits<size_t>::max() - FooterLength ||
      length + FooterLength > dataAndFooter_.max_size()) {
    return Status::TooLarge(length);
  }
  try {
    dataAndFooter_.reserve(size_t(length + FooterLength));
  } catch (const std::length_error&) {
    return Status::TooLarge(length);
  } catch (const std::bad_alloc&) {
    return Status::TooLarge(length);
  }

  dataLength_ = length;
  phase_ = ReadPhase::Data;
  return StatusCode::Success;
}

ReadPhase TFRecordState::phase() const {
  return phase_;
}

uint64_t TFRecordState::bufferedBytes() const {
  return headerSize_ + dataAndFooter_.size();
}

bool TFRecordState::atRecordBoundary() const {
  return phase_ == ReadPhase::Header && headerSize_ == 0;
}

// ReadRecordOptions ///////////////////////////////////////////////////////////

Status ReadRecordOptions::validate() const {
  if (skipCorruptRecords && !checksumData) {
    return Status{StatusCode::InvalidReadOptions,
                  "skipCorruptRecords requires checksumData to be enabled"};
  }
  return StatusCode::Success;
}

// TFRecordReader //////////////////////////////////////////////////////////////

TFRecordReader::~TFRecordReader() {
  close();
}

Status TFRecordReader::open(IByteSource& source, const ReadRecordOptions& options) {
  close();
  return openSource_(source, options);
}

Status TFRecordReader::open(std::string_view filename, const ReadRecordOptions& options) {
  close();
  file_ = std::fopen(std::string(filename).c_str(), "rb");
  if (!file_) {
    const auto msg = internal::StrCat("failed to open \"", filename, "\": ", std::strerror(errno));
    return Status{StatusCode::OpenFailed, msg};
  }

  fileInput_ = std::make_unique<FileSource>(file_);
  auto status = openSource_(*fileInput_, options);
  if (!status.ok()) {
    close();
  }
  return status;
}

Status TFRecordReader::open(std::istream& stream, const ReadRecordOptions& options) {
  close();
  streamInput_ = std::make_unique<StreamSource>(stream);
  auto status = openSource_(*streamInput_, options);
  if (!status.ok()) {
    close();
  }
  return status;
}

Status TFRecordReader::openSource_(IByteSource& source, const ReadRecordOptions& options) {
  if (auto status = options.validate(); !status.ok()) {
    return status;
  }

  switch (options.compression) {
    case Compression::None:
      input_ = &source;
      break;
    case Compression::Zstd:
#ifndef TFRECORD_COMPRESSION_NO_ZSTD
      decompressor_ = std::make_unique<ZStdSource>(source);
      input_ = decompressor_.get();
      break;
#else
      return Status{StatusCode::UnsupportedCompression, "zstd support was not compiled in"};
#endif
    case Compression::Lz4:
#ifndef TFRECORD_COMPRESSION_NO_LZ4
      decompressor_ = std::make_unique<LZ4Source>(source);
      input_ = decompressor_.get();
      break;
#else
      return Status{StatusCode::UnsupportedCompression, "lz4 support was not compiled in"};
#endif
  }

  options_ = options;
  state_ = TFRecordState{};
  status_ = StatusCode::Success;
  recordsRead_ = 0;
  corruptRecords_ = 0;
  return StatusCode::Success;
}

void TFRecordReader::close() {
  input_ = nullptr;
  decompressor_.reset();
  fileInput_.reset();
  streamInput_.reset();
  if (file_) {
    std::fclose(file_);
    file_ = nullptr;
  }
  state_ = TFRecordState{};
  status_ = StatusCode::Success;
}

std::optional<TFRecord> TFRecordReader::next(const ProblemCallback& onProblem) {
  if (!input_) {
    status_ = StatusCode::NotOpen;
    return std::nullopt;
  }

  while (true) {
    TFRecord record;
    status_ = state_.readRecord(*input_, &record);
    if (!status_.ok()) {
      return std::nullopt;
    }

    if (options_.checksumData) {
      if (auto status = record.validate(); !status.ok()) {
        corruptRecords_++;
        onProblem(status);
        if (options_.skipCorruptRecords) {
          continue;
        }
      }
    }
    recordsRead_++;
    return record;
  }
}

const Status& TFRecordReader::status() const {
  return status_;
}

uint64_t TFRecordReader::recordsRead() const {
  return recordsRead_;
}

uint64_t TFRecordReader::corruptRecords() const {
  return corruptRecords_;
}

const TFRecordState& TFRecordReader::state() const {
  return state_;
}

IByteSource* TFRecordReader::dataSource() {
  return input_;
}

}  // namespace tfrecord
