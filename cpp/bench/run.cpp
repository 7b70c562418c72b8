#define TFRECORD_IMPLEMENTATION
#include <tfrecord/tfrecord.hpp>

#include <benchmark/benchmark.h>

#include <cstdio>
#include <cstring>
#include <sstream>
#include <vector>

constexpr size_t WriteIterations = 10000;

static std::vector<std::byte> MakePayload(size_t size) {
  std::vector<std::byte> payload(size);
  for (size_t i = 0; i < size; i++) {
    payload[i] = std::byte(i * 31 + 7);
  }
  return payload;
}

static std::vector<std::byte> MakeFile(size_t recordSize, size_t recordCount,
                                       tfrecord::Compression compression) {
  const auto payload = MakePayload(recordSize);
  tfrecord::BufferWriter out;
  tfrecord::TFRecordWriterOptions options;
  options.compression = compression;
  tfrecord::TFRecordWriter writer;
  if (!writer.open(out, options).ok()) {
    return {};
  }
  for (size_t i = 0; i < recordCount; i++) {
    (void)writer.write(payload.data(), payload.size());
  }
  if (!writer.close().ok()) {
    return {};
  }
  return std::vector<std::byte>(out.data(), out.data() + out.size());
}

static void BM_MaskedCrcCompute(benchmark::State& state) {
  const auto payload = MakePayload(size_t(state.range(0)));
  for (auto _ : state) {
    benchmark::DoNotOptimize(tfrecord::MaskedCrc::Compute(payload.data(), payload.size()));
  }
  state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(payload.size()));
}

static void BM_TFRecordWriterBufferWriter(benchmark::State& state) {
  const auto payload = MakePayload(size_t(state.range(0)));
  const auto compression = tfrecord::Compression(state.range(1));

  tfrecord::BufferWriter out;
  tfrecord::TFRecordWriterOptions options;
  options.compression = compression;
  tfrecord::TFRecordWriter writer;
  if (auto status = writer.open(out, options); !status.ok()) {
    state.SkipWithError(status.message.c_str());
    return;
  }

  while (state.KeepRunning()) {
    for (size_t i = 0; i < WriteIterations; i++) {
      (void)writer.write(payload.data(), payload.size());
      benchmark::ClobberMemory();
    }
    out.clear();
  }

  if (auto status = writer.close(); !status.ok()) {
    state.SkipWithError(status.message.c_str());
  }
}

static void BM_TFRecordWriterStreamWriter(benchmark::State& state) {
  const auto payload = MakePayload(size_t(state.range(0)));

  std::ostringstream stream;
  tfrecord::TFRecordWriter writer;
  if (auto status = writer.open(stream); !status.ok()) {
    state.SkipWithError(status.message.c_str());
    return;
  }

  while (state.KeepRunning()) {
    for (size_t i = 0; i < WriteIterations; i++) {
      (void)writer.write(payload.data(), payload.size());
      benchmark::ClobberMemory();
    }
    stream.str({});
  }

  if (auto status = writer.close(); !status.ok()) {
    state.SkipWithError(status.message.c_str());
  }
}

static void BM_TFRecordStateReadRecord(benchmark::State& state) {
  const auto file = MakeFile(size_t(state.range(0)), WriteIterations, tfrecord::Compression::None);
  const bool validate = state.range(1) != 0;

  for (auto _ : state) {
    tfrecord::BufferSource source{file.data(), file.size()};
    tfrecord::TFRecordState readState;
    tfrecord::TFRecord record;
    while (readState.readRecord(source, &record).ok()) {
      if (validate) {
        benchmark::DoNotOptimize(record.validate().ok());
      }
      benchmark::DoNotOptimize(record.data().data());
    }
  }
  state.SetBytesProcessed(int64_t(state.iterations()) * int64_t(file.size()));
}

static void BM_TFRecordReaderCompressed(benchmark::State& state) {
  const auto compression = tfrecord::Compression(state.range(1));
  const auto file = MakeFile(size_t(state.range(0)), WriteIterations, compression);

  for (auto _ : state) {
    tfrecord::BufferSource source{file.data(), file.size()};
    tfrecord::ReadRecordOptions options;
    options.compression = compression;
    tfrecord::TFRecordReader reader;
    if (auto status = reader.open(source, options); !status.ok()) {
      state.SkipWithError(status.message.c_str());
      return;
    }
    while (auto record = reader.next()) {
      benchmark::DoNotOptimize(record->data().data());
    }
  }
}

int main(int argc, char* argv[]) {
  benchmark::RegisterBenchmark("BM_MaskedCrcCompute", BM_MaskedCrcCompute)
    ->Arg(1)
    ->Arg(64)
    ->Arg(4096)
    ->Arg(1024 * 1024);
  benchmark::RegisterBenchmark("BM_TFRecordWriterBufferWriter", BM_TFRecordWriterBufferWriter)
    ->Args({64, int(tfrecord::Compression::None)})
    ->Args({4096, int(tfrecord::Compression::None)})
#ifndef TFRECORD_COMPRESSION_NO_LZ4
    ->Args({64, int(tfrecord::Compression::Lz4)})
    ->Args({4096, int(tfrecord::Compression::Lz4)})
#endif
#ifndef TFRECORD_COMPRESSION_NO_ZSTD
    ->Args({64, int(tfrecord::Compression::Zstd)})
    ->Args({4096, int(tfrecord::Compression::Zstd)})
#endif
    ;
  benchmark::RegisterBenchmark("BM_TFRecordWriterStreamWriter", BM_TFRecordWriterStreamWriter)
    ->Arg(64)
    ->Arg(4096);
  benchmark::RegisterBenchmark("BM_TFRecordStateReadRecord", BM_TFRecordStateReadRecord)
    ->Args({64, 0})
    ->Args({64, 1})
    ->Args({4096, 0})
    ->Args({4096, 1});
  benchmark::RegisterBenchmark("BM_TFRecordReaderCompressed", BM_TFRecordReaderCompressed)
    ->Args({4096, int(tfrecord::Compression::None)})
#ifndef TFRECORD_COMPRESSION_NO_LZ4
    ->Args({4096, int(tfrecord::Compression::Lz4)})
#endif
#ifndef TFRECORD_COMPRESSION_NO_ZSTD
    ->Args({4096, int(tfrecord::Compression::Zstd)})
#endif
    ;
  benchmark::Initialize(&argc, argv);
  benchmark::RunSpecifiedBenchmarks();

  return 0;
}
