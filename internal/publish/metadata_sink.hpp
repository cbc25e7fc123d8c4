#pragma once

#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include "execmon/v1.hpp"

namespace execmon::publish {

/*
  The host's out-of-band presentation channel.

  Implementations may be called from the execution thread and the timer
  thread concurrently. They report a closed or broken channel by throwing.
*/
class MetadataSink {
 public:
  virtual ~MetadataSink() = default;

  virtual void Publish(const execmon::v1::DisplayData& message) = 0;
};

/*
  Writes one JSON document per line.
*/
class StreamMetadataSink : public MetadataSink {
 public:
  explicit StreamMetadataSink(std::ostream& out);

  // Appends to `path`; throws std::runtime_error if it cannot be opened.
  static std::shared_ptr<StreamMetadataSink> OpenFile(const std::string& path);

  void Publish(const execmon::v1::DisplayData& message) override;

 private:
  explicit StreamMetadataSink(std::unique_ptr<std::ofstream> file);

  std::unique_ptr<std::ofstream> file_;
  std::ostream&                  out_;
  std::mutex                     mutex_;
};

class NullMetadataSink : public MetadataSink {
 public:
  void Publish(const execmon::v1::DisplayData&) override {
  }
};

} // namespace execmon::publish
