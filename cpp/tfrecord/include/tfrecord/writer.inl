#include "internal.hpp"
#include <cerrno>
#ifndef TFRECORD_COMPRESSION_NO_LZ4
#  include <lz4frame.h>
#  include <lz4hc.h>
#endif
#ifndef TFRECORD_COMPRESSION_NO_ZSTD
#  include <zstd.h>
#  include <zstd_errors.h>
#endif

namespace tfrecord {

// IWritable ///////////////////////////////////////////////////////////////////

void IWritable::write(const std::byte* data, uint64_t size) {
  if (size == 0 || !status().ok()) {
    return;
  }
  handleWrite(data, size);
}

Status IWritable::status() const {
  return StatusCode::Success;
}

// FileWriter //////////////////////////////////////////////////////////////////

FileWriter::~FileWriter() {
  end();
}

Status FileWriter::open(std::string_view filename) {
  end();
  status_ = StatusCode::Success;
  file_ = std::fopen(std::string(filename).c_str(), "wb");
  if (!file_) {
    const auto msg = internal::StrCat("failed to open file \"", filename, "\" for writing: ",
                                      std::strerror(errno));
    return Status(StatusCode::OpenFailed, msg);
  }
  return StatusCode::Success;
}

void FileWriter::handleWrite(const std::byte* data, uint64_t size) {
  if (!file_) {
    status_ = StatusCode::NotOpen;
    return;
  }
  const size_t written = std::fwrite(data, 1, size_t(size), file_);
  size_ += written;
  if (written != size) {
    const auto msg =
      internal::StrCat("wrote ", written, " of ", size, " bytes: ", std::strerror(errno));
    status_ = Status{StatusCode::WriteFailed, msg};
  }
}

void FileWriter::flush() {
  if (file_ && std::fflush(file_) != 0 && status_.ok()) {
    status_ = Status{StatusCode::WriteFailed, internal::StrCat("flush failed: ",
                                                               std::strerror(errno))};
  }
}

void FileWriter::end() {
  if (file_) {
    if (std::fclose(file_) != 0 && status_.ok()) {
      status_ = Status{StatusCode::WriteFailed, internal::StrCat("close failed: ",
                                                                 std::strerror(errno))};
    }
    file_ = nullptr;
  }
  size_ = 0;
}

uint64_t FileWriter::size() const {
  return size_;
}

Status FileWriter::status() const {
  return status_;
}

// StreamWriter ////////////////////////////////////////////////////////////////

StreamWriter::StreamWriter(std::ostream& stream)
    : stream_(stream)
    , size_(0) {}

void StreamWriter::handleWrite(const std::byte* data, uint64_t size) {
  stream_.write(reinterpret_cast<const char*>(data), std::streamsize(size));
  if (!stream_) {
    status_ = Status{StatusCode::WriteFailed, internal::StrCat("failed to write ", size,
                                                               " bytes to stream")};
    return;
  }
  size_ += size;
}

void StreamWriter::flush() {
  stream_.flush();
}

void StreamWriter::end() {
  flush();
}

uint64_t StreamWriter::size() const {
  return size_;
}

Status StreamWriter::status() const {
  return status_;
}

// BufferWriter ////////////////////////////////////////////////////////////////

void BufferWriter::handleWrite(const std::byte* data, uint64_t size) {
  buffer_.insert(buffer_.end(), data, data + size);
}

void BufferWriter::end() {
  // no-op
}

uint64_t BufferWriter::size() const {
  return buffer_.size();
}

void BufferWriter::clear() {
  buffer_.clear();
}

const std::byte* BufferWriter::data() const {
  return buffer_.data();
}

// LZ4Writer ///////////////////////////////////////////////////////////////////

#ifndef TFRECORD_COMPRESSION_NO_LZ4
namespace internal {

int LZ4CompressionLevel(CompressionLevel level) {
  switch (level) {
    case CompressionLevel::Fastest:
      return -1;  // "fast acceleration"
    case CompressionLevel::Fast:
      return 0;  // "fast mode"
    case CompressionLevel::Default:
    default:
      return LZ4HC_CLEVEL_DEFAULT;
    case CompressionLevel::Slow:
      return LZ4HC_CLEVEL_OPT_MIN;
    case CompressionLevel::Slowest:
      return LZ4HC_CLEVEL_MAX;
  }
}

LZ4F_preferences_t LZ4Preferences(CompressionLevel level) {
  LZ4F_preferences_t preferences = LZ4F_INIT_PREFERENCES;
  preferences.compressionLevel = LZ4CompressionLevel(level);
  return preferences;
}

}  // namespace internal

LZ4Writer::LZ4Writer(IWritable& output, CompressionLevel compressionLevel)
    : output_(output)
    , compressionLevel_(compressionLevel) {
  const LZ4F_errorCode_t err =
    LZ4F_createCompressionContext((LZ4F_cctx**)&compressionContext_, LZ4F_VERSION);
  if (LZ4F_isError(err)) {
    const auto msg =
      internal::StrCat("failed to create lz4 compression context: ", LZ4F_getErrorName(err));
    status_ = Status{StatusCode::CompressionFailed, msg};
    compressionContext_ = nullptr;
  }
}

LZ4Writer::~LZ4Writer() {
  if (compressionContext_) {
    LZ4F_freeCompressionContext((LZ4F_cctx*)compressionContext_);
  }
}

void LZ4Writer::begin_() {
  if (frameStarted_ || !status_.ok()) {
    return;
  }
  const auto preferences = internal::LZ4Preferences(compressionLevel_);
  compressedBuffer_.resize(LZ4F_HEADER_SIZE_MAX);
  const size_t headerSize =
    LZ4F_compressBegin((LZ4F_cctx*)compressionContext_, compressedBuffer_.data(),
                       compressedBuffer_.size(), &preferences);
  if (LZ4F_isError(headerSize)) {
    const auto msg =
      internal::StrCat("LZ4F_compressBegin failed: ", LZ4F_getErrorName(headerSize));
    status_ = Status{StatusCode::CompressionFailed, msg};
    return;
  }
  output_.write(compressedBuffer_.data(), headerSize);
  frameStarted_ = true;
}

void LZ4Writer::handleWrite(const std::byte* data, uint64_t size) {
  begin_();
  if (!status_.ok()) {
    return;
  }
  const auto preferences = internal::LZ4Preferences(compressionLevel_);
  compressedBuffer_.resize(LZ4F_compressBound(size_t(size), &preferences));
  const size_t dstSize =
    LZ4F_compressUpdate((LZ4F_cctx*)compressionContext_, compressedBuffer_.data(),
                        compressedBuffer_.size(), data, size_t(size), nullptr);
  if (LZ4F_isError(dstSize)) {
    const auto msg = internal::StrCat("LZ4F_compressUpdate failed: ", LZ4F_getErrorName(dstSize));
    status_ = Status{StatusCode::CompressionFailed, msg};
    return;
  }
  output_.write(compressedBuffer_.data(), dstSize);
  size_ += size;
}

void LZ4Writer::flush() {
  if (frameStarted_ && status_.ok()) {
    const auto preferences = internal::LZ4Preferences(compressionLevel_);
    compressedBuffer_.resize(LZ4F_compressBound(0, &preferences));
    const size_t dstSize = LZ4F_flush((LZ4F_cctx*)compressionContext_, compressedBuffer_.data(),
                                      compressedBuffer_.size(), nullptr);
    if (LZ4F_isError(dstSize)) {
      const auto msg = internal::StrCat("LZ4F_flush failed: ", LZ4F_getErrorName(dstSize));
      status_ = Status{StatusCode::CompressionFailed, msg};
      return;
    }
    output_.write(compressedBuffer_.data(), dstSize);
  }
  output_.flush();
}

void LZ4Writer::end() {
  if (!frameStarted_ || !status_.ok()) {
    return;
  }
  const auto preferences = internal::LZ4Preferences(compressionLevel_);
  compressedBuffer_.resize(LZ4F_compressBound(0, &preferences));
  const size_t dstSize = LZ4F_compressEnd((LZ4F_cctx*)compressionContext_,
                                          compressedBuffer_.data(), compressedBuffer_.size(),
                                          nullptr);
  frameStarted_ = false;
  if (LZ4F_isError(dstSize)) {
    const auto msg = internal::StrCat("LZ4F_compressEnd failed: ", LZ4F_getErrorName(dstSize));
    status_ = Status{StatusCode::CompressionFailed, msg};
    return;
  }
  output_.write(compressedBuffer_.data(), dstSize);
}

uint64_t LZ4Writer::size() const {
  return size_;
}

Status LZ4Writer::status() const {
  return status_.ok() ? output_.status() : status_;
}
#endif

// ZStdWriter //////////////////////////////////////////////////////////////////

#ifndef TFRECORD_COMPRESSION_NO_ZSTD
namespace internal {

int ZStdCompressionLevel(CompressionLevel level) {
  switch (level) {
    case CompressionLevel::Fastest:
      return -5;
    case CompressionLevel::Fast:
      return -3;
    case CompressionLevel::Default:
    default:
      return 1;
    case CompressionLevel::Slow:
      return 5;
    case CompressionLevel::Slowest:
      return 19;
  }
}

}  // namespace internal

ZStdWriter::ZStdWriter(IWritable& output, CompressionLevel compressionLevel)
    : output_(output)
    , zstdContext_(ZSTD_createCCtx())
    , compressedBuffer_(ZSTD_CStreamOutSize()) {
  if (!zstdContext_) {
    status_ = Status{StatusCode::CompressionFailed, "failed to create zstd compression context"};
    return;
  }
  ZSTD_CCtx_setParameter(zstdContext_, ZSTD_c_compressionLevel,
                         internal::ZStdCompressionLevel(compressionLevel));
}

ZStdWriter::~ZStdWriter() {
  ZSTD_freeCCtx(zstdContext_);
}

void ZStdWriter::compress_(const std::byte* data, uint64_t size, int endDirective) {
  if (!status_.ok()) {
    return;
  }
  const auto mode = ZSTD_EndDirective(endDirective);
  ZSTD_inBuffer in{data, size_t(size), 0};
  bool finished = false;
  while (!finished) {
    ZSTD_outBuffer out{compressedBuffer_.data(), compressedBuffer_.size(), 0};
    const size_t remaining = ZSTD_compressStream2(zstdContext_, &out, &in, mode);
    if (ZSTD_isError(remaining)) {
      const auto errCode = ZSTD_getErrorCode(remaining);
      const auto msg = internal::StrCat("ZSTD_compressStream2 failed: ",
                                        ZSTD_getErrorName(remaining), " (",
                                        ZSTD_getErrorString(errCode), ")");
      status_ = Status{StatusCode::CompressionFailed, msg};
      return;
    }
    output_.write(compressedBuffer_.data(), out.pos);
    finished = mode == ZSTD_e_continue ? in.pos == in.size : remaining == 0;
  }
}

void ZStdWriter::handleWrite(const std::byte* data, uint64_t size) {
  compress_(data, size, ZSTD_e_continue);
  size_ += size;
}

void ZStdWriter::flush() {
  compress_(nullptr, 0, ZSTD_e_flush);
  output_.flush();
}

void ZStdWriter::end() {
  compress_(nullptr, 0, ZSTD_e_end);
}

uint64_t ZStdWriter::size() const {
  return size_;
}

Status ZStdWriter::status() const {
  return status_.ok() ? output_.status() : status_;
}
#endif

// TFRecordWriter //////////////////////////////////////////////////////////////

TFRecordWriter::~TFRecordWriter() {
  // Nowhere to report a failure from here; callers that care call close() first
  (void)close();
}

Status TFRecordWriter::open(std::string_view filename, const TFRecordWriterOptions& options) {
  if (auto status = close(); !status.ok()) {
    return status;
  }
  fileOutput_ = std::make_unique<FileWriter>();
  if (auto status = fileOutput_->open(filename); !status.ok()) {
    fileOutput_.reset();
    return status;
  }
  auto status = openSink_(*fileOutput_, options);
  if (!status.ok()) {
    reset_();
  }
  return status;
}

Status TFRecordWriter::open(IWritable& writer, const TFRecordWriterOptions& options) {
  if (auto status = close(); !status.ok()) {
    return status;
  }
  return openSink_(writer, options);
}

Status TFRecordWriter::open(std::ostream& stream, const TFRecordWriterOptions& options) {
  if (auto status = close(); !status.ok()) {
    return status;
  }
  streamOutput_ = std::make_unique<StreamWriter>(stream);
  auto status = openSink_(*streamOutput_, options);
  if (!status.ok()) {
    reset_();
  }
  return status;
}

Status TFRecordWriter::openSink_(IWritable& sink, const TFRecordWriterOptions& options) {
  switch (options.compression) {
    case Compression::None:
      break;
    case Compression::Zstd:
#ifndef TFRECORD_COMPRESSION_NO_ZSTD
      compressor_ = std::make_unique<ZStdWriter>(sink, options.compressionLevel);
      break;
#else
      return Status{StatusCode::UnsupportedCompression, "zstd support was not compiled in"};
#endif
    case Compression::Lz4:
#ifndef TFRECORD_COMPRESSION_NO_LZ4
      compressor_ = std::make_unique<LZ4Writer>(sink, options.compressionLevel);
      break;
#else
      return Status{StatusCode::UnsupportedCompression, "lz4 support was not compiled in"};
#endif
  }

  options_ = options;
  sink_ = &sink;
  output_ = compressor_ ? compressor_.get() : sink_;
  recordsWritten_ = 0;
  return output_->status();
}

Status TFRecordWriter::write(const std::byte* data, uint64_t size) {
  return writeRecord_(data, size, MaskedCrc::Compute(data, size));
}

Status TFRecordWriter::write(const TFRecord& record) {
  return writeRecord_(record.data().data(), record.data().size(), record.dataCrc());
}

Status TFRecordWriter::writeRecord_(const std::byte* data, uint64_t size, MaskedCrc dataCrc) {
  if (!output_) {
    return StatusCode::NotOpen;
  }
  WriteRecord(*output_, data, size, dataCrc);
  if (options_.flushEachRecord) {
    output_->flush();
  }
  auto status = output_->status();
  if (status.ok()) {
    recordsWritten_++;
  }
  return status;
}

void TFRecordWriter::flush() {
  if (output_) {
    output_->flush();
  }
}

Status TFRecordWriter::close() {
  Status status;
  if (compressor_) {
    compressor_->end();
    status = compressor_->status();
  }
  if (sink_) {
    sink_->end();
    if (status.ok()) {
      status = sink_->status();
    }
  }
  reset_();
  return status;
}

void TFRecordWriter::reset_() {
  output_ = nullptr;
  sink_ = nullptr;
  compressor_.reset();
  fileOutput_.reset();
  streamOutput_.reset();
}

uint64_t TFRecordWriter::recordsWritten() const {
  return recordsWritten_;
}

IWritable* TFRecordWriter::dataSink() {
  return output_;
}

void TFRecordWriter::WriteRecord(IWritable& output, const std::byte* data, uint64_t size,
                                 MaskedCrc dataCrc) {
  const auto header = internal::EncodeHeader(size);
  output.write(header.data(), header.size());
  output.write(data, size);
  const auto footer = dataCrc.toBytes();
  output.write(footer.data(), footer.size());
}

}  // namespace tfrecord
