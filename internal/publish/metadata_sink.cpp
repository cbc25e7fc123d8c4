#include "internal/publish/metadata_sink.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace execmon::publish {

StreamMetadataSink::StreamMetadataSink(std::ostream& out) : out_(out) {
}

StreamMetadataSink::StreamMetadataSink(std::unique_ptr<std::ofstream> file) : file_(std::move(file)), out_(*file_) {
}

std::shared_ptr<StreamMetadataSink> StreamMetadataSink::OpenFile(const std::string& path) {
  auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
  if (!file->is_open()) {
    throw std::runtime_error("Failed to open metadata sink file: " + path);
  }
  return std::shared_ptr<StreamMetadataSink>(new StreamMetadataSink(std::move(file)));
}

void StreamMetadataSink::Publish(const execmon::v1::DisplayData& message) {
  std::string line;
  auto        status = google::protobuf::util::MessageToJsonString(message, &line);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize display data: " + std::string(status.message()));
  }

  std::lock_guard lock(mutex_);
  if (!out_.good()) {
    throw util::ChannelClosed("metadata channel is closed");
  }
  out_ << line << '\n';
  out_.flush();
  if (!out_.good()) {
    throw util::ChannelClosed("metadata channel write failed");
  }
}

} // namespace execmon::publish
