#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <array>
#include <cstdio>
#include <istream>
#include <memory>
#include <optional>
#include <string_view>

// Forward declaration
#ifndef TFRECORD_COMPRESSION_NO_ZSTD
struct ZSTD_DCtx_s;
#endif

namespace tfrecord {

/**
 * @brief An abstract interface for a readable byte sequence, such as a file
 * that may still be growing.
 */
struct TFRECORD_PUBLIC IByteSource {
  virtual ~IByteSource() = default;

  /**
   * @brief Attempt to read up to `size` bytes into `output`.
   *
   * @param output Buffer with room for at least `size` bytes.
   * @param size The maximum number of bytes to read.
   * @param bytesRead Set to the number of bytes actually written to `output`.
   *   Zero means no more data is available right now; a later call may still
   *   produce more bytes if the underlying data grows. Any bytes reported here
   *   are valid even when a failure Status is returned.
   * @return Status A non-success Status if the underlying source reported an
   *   error. Running out of data is not an error.
   */
  virtual Status read(std::byte* output, uint64_t size, uint64_t* bytesRead) = 0;
};

/**
 * @brief IByteSource implementation wrapping a FILE* pointer created by
 * fopen(). The end-of-file indicator is cleared after every short read, so data
 * appended to the file later is picked up by subsequent reads.
 */
class TFRECORD_PUBLIC FileSource final : public IByteSource {
public:
  FileSource(std::FILE* file);

  Status read(std::byte* output, uint64_t size, uint64_t* bytesRead) override;

private:
  std::FILE* file_;
};

/**
 * @brief IByteSource implementation wrapping a std::istream. As with
 * FileSource, hitting the end of the stream clears the stream state so reading
 * can resume once more data arrives.
 */
class TFRECORD_PUBLIC StreamSource final : public IByteSource {
public:
  StreamSource(std::istream& stream);

  Status read(std::byte* output, uint64_t size, uint64_t* bytesRead) override;

private:
  std::istream& stream_;
};

/**
 * @brief IByteSource implementation reading sequentially from a memory buffer.
 * No data is copied; the buffer must outlive the source.
 */
class TFRECORD_PUBLIC BufferSource final : public IByteSource {
public:
  BufferSource() = default;
  BufferSource(const std::byte* data, uint64_t size);

  /**
   * @brief Point the source at a new buffer and rewind to its beginning.
   */
  void reset(const std::byte* data, uint64_t size);

  Status read(std::byte* output, uint64_t size, uint64_t* bytesRead) override;

  /**
   * @brief Number of bytes consumed so far.
   */
  uint64_t offset() const;

private:
  const std::byte* data_ = nullptr;
  uint64_t size_ = 0;
  uint64_t offset_ = 0;
};

/**
 * @brief An abstract interface for byte sources that decompress another byte
 * source on the fly. Compressed input is pulled from the wrapped source in
 * fixed-size blocks, so a partially written compressed stream yields whatever
 * can be decoded so far.
 */
class TFRECORD_PUBLIC ICompressedSource : public IByteSource {
public:
  ICompressedSource(IByteSource& input);
  virtual ~ICompressedSource() override = default;

  ICompressedSource(const ICompressedSource&) = delete;
  ICompressedSource& operator=(const ICompressedSource&) = delete;
  ICompressedSource(ICompressedSource&&) = delete;
  ICompressedSource& operator=(ICompressedSource&&) = delete;

protected:
  /**
   * @brief Refill the input buffer from the wrapped source. Only called once
   * all previously buffered input has been consumed.
   */
  Status fillInput(uint64_t* bytesRead);

  IByteSource& input_;
  ByteArray inputBuffer_;
  uint64_t inputSize_ = 0;
  uint64_t inputPos_ = 0;
};

#ifndef TFRECORD_COMPRESSION_NO_ZSTD
/**
 * @brief ICompressedSource implementation that decompresses a Zstandard
 * (https://facebook.github.io/zstd/) stream.
 */
class TFRECORD_PUBLIC ZStdSource final : public ICompressedSource {
public:
  ZStdSource(IByteSource& input);
  ~ZStdSource() override;

  Status read(std::byte* output, uint64_t size, uint64_t* bytesRead) override;

private:
  ZSTD_DCtx_s* zstdContext_ = nullptr;
};
#endif

#ifndef TFRECORD_COMPRESSION_NO_LZ4
/**
 * @brief ICompressedSource implementation that decompresses an LZ4 frame
 * (https://lz4.github.io/lz4/) stream.
 */
class TFRECORD_PUBLIC LZ4Source final : public ICompressedSource {
public:
  LZ4Source(IByteSource& input);
  ~LZ4Source() override;

  Status read(std::byte* output, uint64_t size, uint64_t* bytesRead) override;

private:
  void* decompressionContext_ = nullptr;  // LZ4F_dctx*
  Status status_;
};
#endif

/**
 * @brief Which part of a record TFRecordState is waiting for.
 */
enum struct ReadPhase {
  /** Accumulating the 12-byte length + length checksum header. */
  Header,
  /** Header validated; accumulating the data and its trailing checksum. */
  Data,
};

/**
 * @brief Resumable parse state for reading one TFRecord at a time from a byte
 * source, potentially over many attempts while the underlying file is still
 * being written.
 *
 * One state must be used with exactly one logical stream. It holds the prefix
 * of the current record read so far, and is returned to an empty state (without
 * holding on to the data buffer) every time a record is completed.
 */
class TFRECORD_PUBLIC TFRecordState {
public:
  TFRecordState() = default;

  /**
   * @brief Attempt to read a TFRecord, pausing gracefully in the face of
   * truncation.
   *
   * If the source runs out of bytes before the record is complete, returns
   * `StatusCode::Truncated` and keeps every byte read so far; calling again
   * with the same state continues exactly where this call left off. This
   * includes the trivial case of zero bytes being available at a record
   * boundary, so reading "until truncated" is the normal way to consume a file
   * with zero or more well-formed records.
   *
   * The length field is always checked against its checksum. A mismatch
   * (`LengthChecksumMismatch`) or a length that cannot be buffered in memory
   * (`RecordTooLarge`) means the stream cannot be resynchronized: the state
   * keeps reporting the same failure on every further call. The data checksum
   * is not checked here; call `TFRecord::validate()` on the result.
   *
   * @param source The byte source to consume from.
   * @param record Receives the record on success. Untouched otherwise.
   * @return Status
   */
  Status readRecord(IByteSource& source, TFRecord* record);

  ReadPhase phase() const;

  /**
   * @brief Number of bytes of the current, incomplete record buffered so far.
   */
  uint64_t bufferedBytes() const;

  /**
   * @brief True when no bytes of the next record have been consumed. Lets a
   * caller tell a `Truncated` result at a clean record boundary apart from one
   * in the middle of a record.
   */
  bool atRecordBoundary() const;

private:
  Status readHeader_(IByteSource& source);

  ReadPhase phase_ = ReadPhase::Header;
  std::array<std::byte, HeaderLength> header_{};
  uint64_t headerSize_ = 0;
  uint64_t dataLength_ = 0;
  // Data plus footer. Its size is the number of bytes filled; capacity is
  // reserved for dataLength_ + FooterLength once the header is validated.
  ByteArray dataAndFooter_;
};

/**
 * @brief Options for reading records out of a TFRecord stream.
 */
struct TFRECORD_PUBLIC ReadRecordOptions {
  /**
   * @brief Validate the data checksum of every record as it is read. Mismatches
   * are reported to the problem callback passed to `TFRecordReader::next()`.
   */
  bool checksumData = true;
  /**
   * @brief Drop records whose data checksum does not match instead of returning
   * them. Requires `checksumData`.
   */
  bool skipCorruptRecords = false;
  /**
   * @brief Compression applied to the stream as a whole.
   */
  Compression compression = Compression::None;

  /**
   * @brief validate the configuration.
   */
  Status validate() const;
};

/**
 * @brief Reads a sequence of records from a TFRecord file or stream.
 */
class TFRECORD_PUBLIC TFRecordReader final {
public:
  TFRecordReader() = default;
  ~TFRecordReader();

  TFRecordReader(const TFRecordReader&) = delete;
  TFRecordReader& operator=(const TFRecordReader&) = delete;

  /**
   * @brief Start reading from an already constructed IByteSource
   * implementation, which must outlive this reader or the next `close()`.
   *
   * @return Status StatusCode::Success on success. Otherwise the reader is not
   *   considered open.
   */
  Status open(IByteSource& source, const ReadRecordOptions& options = {});
  /**
   * @brief Opens a TFRecord file for reading from a given filename.
   */
  Status open(std::string_view filename, const ReadRecordOptions& options = {});
  /**
   * @brief Start reading from a std::istream.
   */
  Status open(std::istream& stream, const ReadRecordOptions& options = {});

  /**
   * @brief Closes the data source, dropping any partially read record.
   */
  void close();

  /**
   * @brief Read the next complete record.
   *
   * @param onProblem Called with a `DataChecksumMismatch` status for every record
   *   whose data checksum does not match, when `checksumData` is enabled.
   * @return The record, or std::nullopt if none could be read. In that case
   *   `status()` explains why: `StatusCode::Truncated` means no complete record
   *   is available yet, and `next()` may be called again later.
   */
  std::optional<TFRecord> next(const ProblemCallback& onProblem = [](const Status&) {});

  /**
   * @brief The outcome of the last call to `next()`.
   */
  const Status& status() const;

  /**
   * @brief Number of records returned by `next()` so far.
   */
  uint64_t recordsRead() const;

  /**
   * @brief Number of records whose data checksum did not match.
   */
  uint64_t corruptRecords() const;

  const TFRecordState& state() const;

  /**
   * @brief Returns a pointer to the IByteSource records are parsed from (after
   * decompression, if any). Will return nullptr if the reader is not open.
   */
  IByteSource* dataSource();

private:
  Status openSource_(IByteSource& source, const ReadRecordOptions& options);

  IByteSource* input_ = nullptr;
  std::FILE* file_ = nullptr;
  std::unique_ptr<FileSource> fileInput_;
  std::unique_ptr<StreamSource> streamInput_;
  std::unique_ptr<ICompressedSource> decompressor_;
  ReadRecordOptions options_;
  TFRecordState state_;
  Status status_;
  uint64_t recordsRead_ = 0;
  uint64_t corruptRecords_ = 0;
};

}  // namespace tfrecord

#ifdef TFRECORD_IMPLEMENTATION
#  include "reader.inl"
#endif
