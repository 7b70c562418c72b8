#define TFRECORD_IMPLEMENTATION
#include <tfrecord/reader.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>

using json = nlohmann::ordered_json;

json ToJson(const std::byte* data, uint64_t size) {
  json output = json::array();
  for (uint64_t i = 0; i < size; ++i) {
    output.push_back(std::to_string(uint8_t(data[i])));
  }
  return output;
}

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "Usage: " << argv[0] << " <input.tfrecord>\n";
    return 1;
  }

  json recordsJson = json::array();

  const std::string inputFile = argv[1];
  std::ifstream input(inputFile, std::ios::binary);
  tfrecord::StreamSource dataSource{input};
  tfrecord::TFRecordState state;

  while (true) {
    tfrecord::TFRecord record;
    const auto status = state.readRecord(dataSource, &record);
    if (status.code == tfrecord::StatusCode::Truncated && state.atRecordBoundary()) {
      break;
    }
    if (!status.ok()) {
      json output = {{"error", status.message}};
      std::cout << output.dump() << "\n";
      return 1;
    }

    const auto validation = record.validate();
    recordsJson.push_back(json::object({
      {"type", "Record"},
      {"fields", json::array({
                   {"data", ToJson(record.data().data(), record.data().size())},
                   {"data_crc", std::to_string(record.dataCrc().value())},
                   {"length", std::to_string(record.data().size())},
                   {"valid", validation.ok()},
                 })},
    }));
  }

  json output = {{"records", recordsJson}};
  std::cout << output.dump() << "\n";
  return 0;
}
