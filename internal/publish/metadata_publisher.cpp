#include "internal/publish/metadata_publisher.hpp"

#include <google/protobuf/util/json_util.h>

#include <utility>

#include "internal/observability/logging.hpp"

namespace execmon::publish {

using observability::IntField;
using observability::StringField;

namespace {

void SetNumber(google::protobuf::Struct& payload, const std::string& key, double value) {
  (*payload.mutable_fields())[key].set_number_value(value);
}

void SetString(google::protobuf::Struct& payload, const std::string& key, const std::string& value) {
  (*payload.mutable_fields())[key].set_string_value(value);
}

void SetBool(google::protobuf::Struct& payload, const std::string& key, bool value) {
  (*payload.mutable_fields())[key].set_bool_value(value);
}

} // namespace

MetadataPublisher::MetadataPublisher(std::shared_ptr<MetadataSink> sink, std::shared_ptr<spdlog::logger> logger,
                                     bool debug_transport_messages)
    : sink_(std::move(sink)), logger_(std::move(logger)), debug_transport_messages_(debug_transport_messages) {
}

google::protobuf::Struct MetadataPublisher::ToPayload(const model::ExecutionRecord& record) {
  google::protobuf::Struct payload;
  SetNumber(payload, "execution_count", static_cast<double>(record.sequence_number));
  SetNumber(payload, "duration_seconds", record.DurationSeconds());
  SetBool(payload, "success", record.success);
  if (record.error_kind) {
    SetString(payload, "error_kind", *record.error_kind);
  }
  return payload;
}

google::protobuf::Struct MetadataPublisher::ToPayload(const model::ExecutionNotice& notice) {
  google::protobuf::Struct payload;
  SetNumber(payload, "execution_count", static_cast<double>(notice.sequence_number));
  SetString(payload, "kind", model::ToString(notice.kind));
  SetNumber(payload, "elapsed_seconds", notice.elapsed_seconds);
  SetNumber(payload, "threshold_seconds", notice.threshold_seconds);
  SetString(payload, "code_preview", notice.code_preview);
  return payload;
}

void MetadataPublisher::Publish(const model::ExecutionRecord& record) {
  try {
    Forward(kExecutionMetadataContentType, ToPayload(record), record.sequence_number);
  } catch (const std::exception& e) {
    failures_.fetch_add(1);
    observability::Log(*logger_, spdlog::level::warn, "Failed to publish execution metadata",
                       {IntField("count", static_cast<std::int64_t>(record.sequence_number)), StringField("error", e.what())});
  }
}

void MetadataPublisher::PublishNotice(const model::ExecutionNotice& notice) {
  try {
    Forward(kExecutionNoticeContentType, ToPayload(notice), notice.sequence_number);
  } catch (const std::exception& e) {
    failures_.fetch_add(1);
    observability::Log(*logger_, spdlog::level::warn, "Failed to publish execution notice",
                       {IntField("count", static_cast<std::int64_t>(notice.sequence_number)),
                        StringField("kind", model::ToString(notice.kind)), StringField("error", e.what())});
  }
}

void MetadataPublisher::Forward(const char* content_type, const google::protobuf::Struct& payload,
                                model::SequenceNumber sequence) {
  if (!sink_) {
    return;
  }

  execmon::v1::DisplayData envelope;
  envelope.set_output_type("display_data");
  *(*envelope.mutable_data())[std::string(content_type)].mutable_struct_value() = payload;

  if (debug_transport_messages_ && logger_->should_log(spdlog::level::debug)) {
    std::string json;
    if (google::protobuf::util::MessageToJsonString(envelope, &json).ok()) {
      observability::Log(*logger_, spdlog::level::debug, "Publishing display_data",
                         {IntField("count", static_cast<std::int64_t>(sequence)), StringField("content_type", content_type),
                          StringField("message", json)});
    }
  }

  sink_->Publish(envelope);
}

} // namespace execmon::publish
