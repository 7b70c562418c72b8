#define TFRECORD_IMPLEMENTATION
#include <tfrecord/writer.hpp>

#include <charconv>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

// Append a record to a TFRecord file every few hundred milliseconds, flushing
// after each one. Run `tfrecorddump --follow` against the same file to watch
// records arrive as they are written.
int main(int argc, char* argv[]) {
  const auto usage = [&]() {
    std::cerr << "Usage: " << argv[0] << " <output.tfrecord> [count] [compression]\n";
    return 1;
  };
  if (argc < 2 || argc > 4) {
    return usage();
  }

  const std::string outputFile = argv[1];
  int count = 20;
  if (argc > 2) {
    const std::string_view countArg = argv[2];
    const auto [end, ec] =
      std::from_chars(countArg.data(), countArg.data() + countArg.size(), count);
    if (ec != std::errc{} || end != countArg.data() + countArg.size() || count < 0) {
      return usage();
    }
  }

  tfrecord::TFRecordWriterOptions options;
  options.flushEachRecord = true;
  if (argc > 3) {
    const auto compression = tfrecord::ParseCompression(argv[3]);
    if (!compression) {
      std::cerr << "Unknown compression: " << argv[3] << "\n";
      return 1;
    }
    options.compression = *compression;
  }

  tfrecord::TFRecordWriter writer;
  auto res = writer.open(outputFile, options);
  if (!res.ok()) {
    std::cerr << "Failed to open " << outputFile << ": " << res.message << "\n";
    return 1;
  }

  for (int i = 0; i < count; i++) {
    const std::string payload = "step " + std::to_string(i);
    res = writer.write(reinterpret_cast<const std::byte*>(payload.data()), payload.size());
    if (!res.ok()) {
      std::cerr << "Failed to write record: " << res.message << "\n";
      (void)writer.close();
      return 1;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
  }

  res = writer.close();
  if (!res.ok()) {
    std::cerr << "Failed to close " << outputFile << ": " << res.message << "\n";
    return 1;
  }
  std::cout << "Wrote " << count << " records to " << outputFile << "\n";
  return 0;
}
