#include "internal/publish/metadata_publisher.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/test_support.hpp"

namespace {

using execmon::model::ExecutionNotice;
using execmon::model::ExecutionOutcome;
using execmon::model::ExecutionRecord;
using execmon::model::NoticeKind;
using execmon::publish::kExecutionMetadataContentType;
using execmon::publish::kExecutionNoticeContentType;
using execmon::publish::MetadataPublisher;
using execmon::publish::StreamMetadataSink;
using execmon::testing::LogCapture;
using execmon::testing::RecordingSink;
using namespace std::chrono_literals;

ExecutionRecord SealedRecord(std::uint64_t sequence, bool success, std::optional<std::string> error_kind = std::nullopt) {
  ExecutionRecord record;
  record.sequence_number = sequence;
  record.start_time      = execmon::util::Now();
  record.Seal(record.start_time + 250ms, ExecutionOutcome{success, std::move(error_kind)});
  return record;
}

void TestRecordEnvelope() {
  LogCapture        capture("publisher");
  auto              sink = std::make_shared<RecordingSink>();
  MetadataPublisher publisher(sink, capture.logger());

  publisher.Publish(SealedRecord(5, false, std::string("KeyError")));

  const auto messages = sink->Messages();
  assert(messages.size() == 1);
  assert(messages[0].output_type() == "display_data");
  assert(messages[0].data().size() == 1);

  const auto& fields = messages[0].data().at(kExecutionMetadataContentType).struct_value().fields();
  assert(fields.size() == 4);
  assert(fields.at("execution_count").number_value() == 5);
  assert(fields.at("duration_seconds").number_value() > 0.24);
  assert(!fields.at("success").bool_value());
  assert(fields.at("error_kind").string_value() == "KeyError");
}

void TestSuccessOmitsErrorKind() {
  auto payload = MetadataPublisher::ToPayload(SealedRecord(1, true));
  assert(payload.fields().size() == 3);
  assert(payload.fields().count("error_kind") == 0);
}

void TestNoticeEnvelope() {
  LogCapture        capture("publisher");
  auto              sink = std::make_shared<RecordingSink>();
  MetadataPublisher publisher(sink, capture.logger());

  publisher.PublishNotice(ExecutionNotice{3, NoticeKind::kTimeout, 301.5, 300.0, "while True: pass"});

  const auto notices = sink->Messages(kExecutionNoticeContentType);
  assert(notices.size() == 1);
  const auto& fields = notices[0].data().at(kExecutionNoticeContentType).struct_value().fields();
  assert(fields.at("execution_count").number_value() == 3);
  assert(fields.at("kind").string_value() == "TIMEOUT");
  assert(fields.at("elapsed_seconds").number_value() == 301.5);
  assert(fields.at("threshold_seconds").number_value() == 300.0);
  assert(fields.at("code_preview").string_value() == "while True: pass");
}

void TestFailuresAreCountedNotThrown() {
  LogCapture        capture("publisher");
  auto              sink = std::make_shared<RecordingSink>();
  MetadataPublisher publisher(sink, capture.logger());
  sink->SetFailing(true);

  publisher.Publish(SealedRecord(1, true));
  publisher.PublishNotice(ExecutionNotice{1, NoticeKind::kWarning, 1.0, 1.0, "x"});

  assert(publisher.FailureCount() == 2);
  const auto warnings = capture.Matching("Failed to publish");
  assert(warnings.size() == 2);
  assert(warnings[0].level == spdlog::level::warn);

  sink->SetFailing(false);
  publisher.Publish(SealedRecord(2, true));
  assert(sink->Messages().size() == 1);
  assert(publisher.FailureCount() == 2);
}

void TestTransportDebugLogging() {
  LogCapture        capture("publisher");
  auto              sink = std::make_shared<RecordingSink>();
  MetadataPublisher quiet(sink, capture.logger());
  MetadataPublisher verbose(sink, capture.logger(), true);

  quiet.Publish(SealedRecord(1, true));
  assert(capture.Count("Publishing display_data") == 0);

  verbose.Publish(SealedRecord(2, true));
  const auto lines = capture.Matching("Publishing display_data");
  assert(lines.size() == 1);
  assert(lines[0].level == spdlog::level::debug);
  assert(lines[0].text.find(kExecutionMetadataContentType) != std::string::npos);
}

void TestStreamSinkWritesJsonLines() {
  std::ostringstream out;
  LogCapture         capture("publisher");
  MetadataPublisher  publisher(std::make_shared<StreamMetadataSink>(out), capture.logger());

  publisher.Publish(SealedRecord(9, true));
  publisher.PublishNotice(ExecutionNotice{9, NoticeKind::kWarning, 240.2, 240.0, "x"});

  std::istringstream in(out.str());
  std::string        first;
  std::string        second;
  std::getline(in, first);
  std::getline(in, second);

  assert(first.find("\"outputType\":\"display_data\"") != std::string::npos);
  assert(first.find(kExecutionMetadataContentType) != std::string::npos);
  assert(first.find("\"execution_count\":9") != std::string::npos);
  assert(second.find(kExecutionNoticeContentType) != std::string::npos);
  assert(second.find("\"kind\":\"WARNING\"") != std::string::npos);
}

void TestClosedStreamIsReported() {
  std::ostringstream out;
  out.setstate(std::ios::badbit);
  StreamMetadataSink sink(out);

  bool threw = false;
  try {
    sink.Publish(execmon::v1::DisplayData{});
  } catch (const execmon::util::ChannelClosed&) {
    threw = true;
  }
  assert(threw);
}

void TestFileSinkAppends() {
  const auto path = std::filesystem::temp_directory_path() / "execmon_metadata_publisher_test.jsonl";
  std::filesystem::remove(path);

  LogCapture capture("publisher");
  {
    MetadataPublisher publisher(StreamMetadataSink::OpenFile(path.string()), capture.logger());
    publisher.Publish(SealedRecord(1, true));
  }
  {
    MetadataPublisher publisher(StreamMetadataSink::OpenFile(path.string()), capture.logger());
    publisher.Publish(SealedRecord(2, true));
  }

  std::ifstream in(path);
  std::string   line;
  int           lines = 0;
  while (std::getline(in, line)) ++lines;
  assert(lines == 2);

  bool threw = false;
  try {
    (void)StreamMetadataSink::OpenFile("/nonexistent-dir/metadata.jsonl");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRecordEnvelope();
  TestSuccessOmitsErrorKind();
  TestNoticeEnvelope();
  TestFailuresAreCountedNotThrown();
  TestTransportDebugLogging();
  TestStreamSinkWritesJsonLines();
  TestClosedStreamIsReported();
  TestFileSinkAppends();

  std::cout << "execmon_unit_metadata_publisher: pass\n";
  return 0;
}
