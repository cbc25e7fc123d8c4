#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include <google/protobuf/struct.pb.h>
#include <spdlog/logger.h>

#include "internal/model/execution_record.hpp"
#include "internal/publish/metadata_sink.hpp"

namespace execmon::publish {

// Fixed content types a downstream viewer keys on.
inline constexpr const char* kExecutionMetadataContentType = "application/vnd.deepnote.execution-metadata+json";
inline constexpr const char* kExecutionNoticeContentType   = "application/vnd.deepnote.execution-notice+json";

/*
  Formats execution results into display_data envelopes and forwards them
  to the presentation channel.

  Never throws: a failed publication is logged once, counted, and dropped.
*/
class MetadataPublisher {
 public:
  MetadataPublisher(std::shared_ptr<MetadataSink> sink, std::shared_ptr<spdlog::logger> logger,
                    bool debug_transport_messages = false);

  void Publish(const model::ExecutionRecord& record);
  void PublishNotice(const model::ExecutionNotice& notice);

  std::uint64_t FailureCount() const {
    return failures_.load();
  }

  static google::protobuf::Struct ToPayload(const model::ExecutionRecord& record);
  static google::protobuf::Struct ToPayload(const model::ExecutionNotice& notice);

 private:
  void Forward(const char* content_type, const google::protobuf::Struct& payload, model::SequenceNumber sequence);

  std::shared_ptr<MetadataSink>   sink_;
  std::shared_ptr<spdlog::logger> logger_;
  const bool                      debug_transport_messages_;

  std::atomic<std::uint64_t> failures_{0};
};

} // namespace execmon::publish
