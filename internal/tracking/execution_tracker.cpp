#include "internal/tracking/execution_tracker.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace execmon::tracking {

using observability::BoolField;
using observability::IntField;
using observability::LogEvent;
using observability::SecondsField;
using observability::StringField;

ExecutionTracker::ExecutionTracker(std::shared_ptr<spdlog::logger> logger,
                                   std::shared_ptr<publish::MetadataPublisher> publisher)
    : logger_(std::move(logger)), publisher_(std::move(publisher)) {
}

model::SequenceNumber ExecutionTracker::OnPreExecute(const std::optional<std::string>& cell_id, std::string_view source) {
  try {
    if (current_) {
      // The host skipped a post-execute; close the orphan so every start keeps its end.
      observability::Log(*logger_, spdlog::level::warn, "EXEC_START while previous execution is still open",
                         {IntField("count", static_cast<std::int64_t>(current_->sequence_number))});
      auto orphan = std::move(*current_);
      current_.reset();
      Finish(std::move(orphan), model::ExecutionOutcome{false, std::string("Abandoned")});
    }

    model::ExecutionRecord record;
    record.sequence_number = ++execution_count_;
    record.cell_id         = cell_id;
    record.source_preview  = model::MakeSourcePreview(source);
    record.start_time      = util::Now();

    const auto log_preview = model::MakeSourcePreview(record.source_preview, model::kLogPreviewLength);
    LogEvent(*logger_, spdlog::level::info, "EXEC_START",
             {IntField("count", static_cast<std::int64_t>(record.sequence_number)),
              StringField("cell_id", record.cell_id.value_or("unknown")),
              StringField("preview", observability::EscapeNewlines(log_preview))});

    current_ = std::move(record);
    return current_->sequence_number;
  } catch (const std::exception& e) {
    observability::Log(*logger_, spdlog::level::err, "Execution tracking failed at start", {StringField("error", e.what())});
    return model::kUnknownSequence;
  }
}

void ExecutionTracker::OnPostExecute(const model::ExecutionOutcome& outcome) {
  try {
    if (!current_) {
      observability::Log(*logger_, spdlog::level::warn, "EXEC_END called without matching EXEC_START");
      model::ExecutionRecord synthesized;
      synthesized.sequence_number = model::kUnknownSequence;
      synthesized.source_preview  = model::MakeSourcePreview({});
      synthesized.start_time      = util::Now();
      Finish(std::move(synthesized), outcome);
      return;
    }

    auto record = std::move(*current_);
    current_.reset();
    Finish(std::move(record), outcome);
  } catch (const std::exception& e) {
    current_.reset();
    observability::Log(*logger_, spdlog::level::err, "Execution tracking failed at end", {StringField("error", e.what())});
  }
}

void ExecutionTracker::Finish(model::ExecutionRecord record, const model::ExecutionOutcome& outcome) {
  record.Seal(util::Now(), outcome);

  const auto count    = IntField("count", static_cast<std::int64_t>(record.sequence_number));
  const auto duration = SecondsField("duration", record.DurationSeconds(), 2);
  const auto success  = BoolField("success", record.success);
  if (record.error_kind) {
    LogEvent(*logger_, spdlog::level::info, "EXEC_END", {count, duration, success, StringField("error", *record.error_kind)});
  } else {
    LogEvent(*logger_, spdlog::level::info, "EXEC_END", {count, duration, success});
  }

  if (publisher_) {
    publisher_->Publish(record);
  }
}

void ExecutionTracker::OnPreRunCell(std::string_view source) {
  try {
    const auto preview = model::MakeSourcePreview(source, model::kRunCellPreviewLength);
    LogEvent(*logger_, spdlog::level::debug, "PRE_RUN", {StringField("preview", observability::EscapeNewlines(preview))});
  } catch (const std::exception& e) {
    observability::Log(*logger_, spdlog::level::err, "Execution tracking failed at pre_run_cell", {StringField("error", e.what())});
  }
}

void ExecutionTracker::OnPostRunCell(std::int64_t execution_count) {
  LogEvent(*logger_, spdlog::level::debug, "POST_RUN", {IntField("exec_count", execution_count)});
}

std::optional<model::SequenceNumber> ExecutionTracker::CurrentExecution() const {
  if (!current_) return std::nullopt;
  return current_->sequence_number;
}

} // namespace execmon::tracking
