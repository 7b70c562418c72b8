#pragma once

#include "types.hpp"
#include "visibility.hpp"
#include <cstdio>
#include <memory>
#include <ostream>
#include <string_view>
#include <vector>

// Forward declaration
#ifndef TFRECORD_COMPRESSION_NO_ZSTD
struct ZSTD_CCtx_s;
#endif

namespace tfrecord {

/**
 * @brief Configuration options for TFRecordWriter.
 */
struct TFRECORD_PUBLIC TFRecordWriterOptions {
  /**
   * @brief Compression applied to the output stream as a whole. Readers must be
   * opened with the same setting in `ReadRecordOptions::compression`.
   */
  Compression compression = Compression::None;
  /**
   * @brief Compression level to use when compression is enabled.
   */
  CompressionLevel compressionLevel = CompressionLevel::Default;
  /**
   * @brief Flush the output after every record, so that a reader tailing the
   * file sees each record as soon as it is written.
   */
  bool flushEachRecord = false;
};

/**
 * @brief An abstract interface for writing TFRecord data.
 */
class TFRECORD_PUBLIC IWritable {
public:
  virtual ~IWritable() = default;

  /**
   * @brief Called whenever the writer needs to write data to the output. Once
   * `status()` reports a failure, further writes are dropped.
   *
   * @param data A pointer to the data to write.
   * @param size Size of the data in bytes.
   */
  void write(const std::byte* data, uint64_t size);
  /**
   * @brief Called when the writer is finished writing data to the output.
   */
  virtual void end() = 0;
  /**
   * @brief Returns the number of bytes passed to `write()` so far.
   */
  virtual uint64_t size() const = 0;
  /**
   * @brief flushes any buffered data to the output. Defaults to a no-op.
   */
  virtual void flush() {}
  /**
   * @brief Returns the first failure this output encountered, if any.
   */
  virtual Status status() const;

protected:
  virtual void handleWrite(const std::byte* data, uint64_t size) = 0;
};

/**
 * @brief Implements the IWritable interface used by TFRecordWriter by wrapping a
 * FILE* pointer created by fopen().
 */
class TFRECORD_PUBLIC FileWriter final : public IWritable {
public:
  ~FileWriter() override;

  Status open(std::string_view filename);

  void handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  void flush() override;
  uint64_t size() const override;
  Status status() const override;

private:
  std::FILE* file_ = nullptr;
  uint64_t size_ = 0;
  Status status_;
};

/**
 * @brief Implements the IWritable interface used by TFRecordWriter by wrapping a
 * std::ostream stream.
 */
class TFRECORD_PUBLIC StreamWriter final : public IWritable {
public:
  StreamWriter(std::ostream& stream);

  void handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  void flush() override;
  uint64_t size() const override;
  Status status() const override;

private:
  std::ostream& stream_;
  uint64_t size_ = 0;
  Status status_;
};

/**
 * @brief An in-memory IWritable implementation backed by a growable buffer.
 */
class TFRECORD_PUBLIC BufferWriter final : public IWritable {
public:
  void handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  uint64_t size() const override;
  /**
   * @brief Discard everything written so far.
   */
  void clear();
  const std::byte* data() const;

private:
  std::vector<std::byte> buffer_;
};

#ifndef TFRECORD_COMPRESSION_NO_LZ4
/**
 * @brief An IWritable that LZ4-frame compresses everything written to it and
 * forwards the compressed bytes to another IWritable. `end()` finishes the
 * frame but does not end the wrapped output.
 */
class TFRECORD_PUBLIC LZ4Writer final : public IWritable {
public:
  LZ4Writer(IWritable& output, CompressionLevel compressionLevel);
  ~LZ4Writer() override;

  LZ4Writer(const LZ4Writer&) = delete;
  LZ4Writer& operator=(const LZ4Writer&) = delete;

  void handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  void flush() override;
  uint64_t size() const override;
  Status status() const override;

private:
  void begin_();

  IWritable& output_;
  void* compressionContext_ = nullptr;  // LZ4F_cctx*
  CompressionLevel compressionLevel_;
  std::vector<std::byte> compressedBuffer_;
  uint64_t size_ = 0;
  bool frameStarted_ = false;
  Status status_;
};
#endif

#ifndef TFRECORD_COMPRESSION_NO_ZSTD
/**
 * @brief An IWritable that Zstandard compresses everything written to it and
 * forwards the compressed bytes to another IWritable. `end()` finishes the
 * frame but does not end the wrapped output.
 */
class TFRECORD_PUBLIC ZStdWriter final : public IWritable {
public:
  ZStdWriter(IWritable& output, CompressionLevel compressionLevel);
  ~ZStdWriter() override;

  ZStdWriter(const ZStdWriter&) = delete;
  ZStdWriter& operator=(const ZStdWriter&) = delete;

  void handleWrite(const std::byte* data, uint64_t size) override;
  void end() override;
  void flush() override;
  uint64_t size() const override;
  Status status() const override;

private:
  void compress_(const std::byte* data, uint64_t size, int endDirective);

  IWritable& output_;
  ZSTD_CCtx_s* zstdContext_ = nullptr;
  std::vector<std::byte> compressedBuffer_;
  uint64_t size_ = 0;
  Status status_;
};
#endif

/**
 * @brief Provides a write interface to a TFRecord file.
 */
class TFRECORD_PUBLIC TFRecordWriter final {
public:
  TFRecordWriter() = default;
  ~TFRecordWriter();

  TFRecordWriter(const TFRecordWriter&) = delete;
  TFRecordWriter& operator=(const TFRecordWriter&) = delete;

  /**
   * @brief Open a new TFRecord file for writing.
   *
   * If the writer was already opened, this calls `close()` first and returns
   * its failure, if any, without opening the new file.
   *
   * @param filename Filename of the TFRecord file to write.
   * @param options Options for TFRecord writing.
   * @return A non-success status if the file could not be opened for writing.
   */
  Status open(std::string_view filename, const TFRecordWriterOptions& options = {});
  /**
   * @brief Open a new TFRecord stream for writing to an existing IWritable,
   * which must outlive this writer or the next `close()`.
   */
  Status open(IWritable& writer, const TFRecordWriterOptions& options = {});
  /**
   * @brief Open a new TFRecord stream for writing to a std::ostream.
   */
  Status open(std::ostream& stream, const TFRecordWriterOptions& options = {});

  /**
   * @brief Write one record, computing the data checksum from `data`.
   */
  Status write(const std::byte* data, uint64_t size);
  /**
   * @brief Write a record with the data checksum it carries, which is written
   * verbatim even if it does not match the data.
   */
  Status write(const TFRecord& record);

  /**
   * @brief Flush buffered (and, if enabled, compressed) data to the output.
   */
  void flush();
  /**
   * @brief Finish the compressed stream if any, end the output, and reset the
   * writer. A writer may be re-used after being closed.
   *
   * @return The first failure raised while finishing the stream or ending the
   * output (for example when `fclose` cannot write buffered data), otherwise
   * StatusCode::Success. The writer is reset either way.
   */
  Status close();

  uint64_t recordsWritten() const;

  /**
   * @brief Returns a pointer to the IWritable records are ultimately written to
   * (after compression, if any). Will return nullptr if the writer is not open.
   */
  IWritable* dataSink();

  /**
   * @brief Serialize one record (header, data, footer) to `output`.
   */
  static void WriteRecord(IWritable& output, const std::byte* data, uint64_t size,
                          MaskedCrc dataCrc);

private:
  Status openSink_(IWritable& sink, const TFRecordWriterOptions& options);
  Status writeRecord_(const std::byte* data, uint64_t size, MaskedCrc dataCrc);
  void reset_();

  TFRecordWriterOptions options_;
  IWritable* sink_ = nullptr;
  IWritable* output_ = nullptr;
  std::unique_ptr<FileWriter> fileOutput_;
  std::unique_ptr<StreamWriter> streamOutput_;
  std::unique_ptr<IWritable> compressor_;
  uint64_t recordsWritten_ = 0;
};

}  // namespace tfrecord

#ifdef TFRECORD_IMPLEMENTATION
#  include "writer.inl"
#endif
