#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

#include "internal/model/execution_record.hpp"
#include "internal/publish/metadata_publisher.hpp"

namespace execmon::tracking {

/*
  Observes every execution of the host.

  Runs on the execution thread only. Hooks never throw: observation must
  not block the observed code.
*/
class ExecutionTracker {
 public:
  ExecutionTracker(std::shared_ptr<spdlog::logger> logger, std::shared_ptr<publish::MetadataPublisher> publisher);

  // Returns the sequence number assigned, kUnknownSequence if tracking failed.
  model::SequenceNumber OnPreExecute(const std::optional<std::string>& cell_id, std::string_view source);
  void                  OnPostExecute(const model::ExecutionOutcome& outcome);

  void OnPreRunCell(std::string_view source);
  void OnPostRunCell(std::int64_t execution_count);

  std::optional<model::SequenceNumber> CurrentExecution() const;

  model::SequenceNumber ExecutionCount() const {
    return execution_count_;
  }

 private:
  void Finish(model::ExecutionRecord record, const model::ExecutionOutcome& outcome);

  std::shared_ptr<spdlog::logger>            logger_;
  std::shared_ptr<publish::MetadataPublisher> publisher_;

  model::SequenceNumber                 execution_count_{0};
  std::optional<model::ExecutionRecord> current_;
};

} // namespace execmon::tracking
