#define TFRECORD_IMPLEMENTATION
#include <tfrecord/reader.hpp>

#include <fmt/core.h>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

template <typename... T>
[[nodiscard]] inline std::string StrFormat(std::string_view msg, T&&... args) {
  return fmt::format(msg, std::forward<T>(args)...);
}

constexpr auto FollowPollInterval = std::chrono::milliseconds(250);

std::string ToString(const tfrecord::TFRecord& record, uint64_t index, bool checked) {
  std::string checksum = "unchecked";
  if (checked) {
    const auto status = record.validate();
    checksum = status.ok() ? "ok" : status.message;
  }
  return StrFormat("[Record] index={}, length={}, data_crc={}, checksum={}", index,
                   record.data().size(), record.dataCrc().toString(), checksum);
}

void Usage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--follow] [--compression=zstd|lz4] [--no-checksum] <input.tfrecord>\n";
}

int main(int argc, char* argv[]) {
  bool follow = false;
  tfrecord::ReadRecordOptions options;
  bool checksum = true;
  std::string inputFile;

  for (int i = 1; i < argc; i++) {
    const std::string_view arg = argv[i];
    if (arg == "--follow") {
      follow = true;
    } else if (arg == "--no-checksum") {
      checksum = false;
    } else if (arg.substr(0, 14) == "--compression=") {
      const auto compression = tfrecord::ParseCompression(arg.substr(14));
      if (!compression) {
        std::cerr << "Unknown compression: " << arg.substr(14) << "\n";
        return 1;
      }
      options.compression = *compression;
    } else if (!arg.empty() && arg[0] != '-' && inputFile.empty()) {
      inputFile = std::string(arg);
    } else {
      Usage(argv[0]);
      return 1;
    }
  }
  if (inputFile.empty()) {
    Usage(argv[0]);
    return 1;
  }
  // Records are validated while printing, so mismatching records are still listed
  options.checksumData = false;

  tfrecord::TFRecordReader reader;
  if (auto status = reader.open(std::string_view(inputFile), options); !status.ok()) {
    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  uint64_t index = 0;
  while (true) {
    const auto record = reader.next();
    if (record) {
      std::cout << ToString(*record, index++, checksum) << "\n";
      continue;
    }

    const auto& status = reader.status();
    if (status.code == tfrecord::StatusCode::Truncated) {
      if (follow) {
        std::cout.flush();
        std::this_thread::sleep_for(FollowPollInterval);
        continue;
      }
      if (!reader.state().atRecordBoundary()) {
        std::cerr << fmt::format("! {} ({} bytes of an incomplete record)\n", status.message,
                                 reader.state().bufferedBytes());
      }
      break;
    }

    std::cerr << "! " << status.message << "\n";
    return 1;
  }

  reader.close();
  return 0;
}
