#include "internal/model/execution_record.hpp"

namespace execmon::model {

double ExecutionRecord::DurationSeconds() const {
  return util::SecondsBetween(start_time, end_time);
}

void ExecutionRecord::Seal(util::TimePoint end, const ExecutionOutcome& outcome) {
  end_time = end < start_time ? start_time : end;
  success  = outcome.success;

  if (success) {
    error_kind.reset();
  } else {
    error_kind = (outcome.error_kind && !outcome.error_kind->empty()) ? *outcome.error_kind : "UnknownError";
  }

  sealed = true;
}

std::string MakeSourcePreview(std::string_view source, std::size_t limit) {
  if (source.empty()) return "<empty>";
  if (source.size() <= limit) return std::string(source);

  std::size_t cut = limit;
  // Back off continuation bytes (10xxxxxx) so the cut lands on a boundary.
  while (cut > 0 && (static_cast<unsigned char>(source[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return std::string(source.substr(0, cut));
}

const char* ToString(NoticeKind kind) {
  switch (kind) {
    case NoticeKind::kWarning:
      return "WARNING";
    case NoticeKind::kTimeout:
      return "TIMEOUT";
  }
  return "UNKNOWN";
}

} // namespace execmon::model
