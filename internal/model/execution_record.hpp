#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace execmon::model {

using SequenceNumber = std::uint64_t;

// Reserved for the record synthesized when post-execute has no matching start.
inline constexpr SequenceNumber kUnknownSequence = 0;

inline constexpr std::size_t kSourcePreviewLength = 100;
inline constexpr std::size_t kLogPreviewLength    = 50;
inline constexpr std::size_t kRunCellPreviewLength = 30;

struct ExecutionOutcome {
  bool                       success{true};
  std::optional<std::string> error_kind;
};

/*
  One unit of execution.

  Created at pre-execute, sealed at post-execute; never mutated after Seal().
  success == false  <=>  error_kind has a value.
*/
struct ExecutionRecord {
  SequenceNumber             sequence_number{kUnknownSequence};
  std::optional<std::string> cell_id;
  std::string                source_preview;

  util::TimePoint start_time{};
  util::TimePoint end_time{};

  bool                       success{true};
  std::optional<std::string> error_kind;
  bool                       sealed{false};

  double DurationSeconds() const;

  void Seal(util::TimePoint end, const ExecutionOutcome& outcome);
};

/*
  Bounded snippet of the source for log readability.

  Cuts at `limit` bytes without splitting a UTF-8 sequence. Empty source
  yields "<empty>".
*/
std::string MakeSourcePreview(std::string_view source, std::size_t limit = kSourcePreviewLength);

enum class NoticeKind : std::uint8_t {
  kWarning = 1,
  kTimeout = 2,
};

const char* ToString(NoticeKind kind);

// Threshold crossing forwarded to the presentation channel.
struct ExecutionNotice {
  SequenceNumber sequence_number{kUnknownSequence};
  NoticeKind     kind{NoticeKind::kWarning};
  double         elapsed_seconds{0.0};
  double         threshold_seconds{0.0};
  std::string    code_preview;
};

} // namespace execmon::model
