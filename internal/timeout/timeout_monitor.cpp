#include "internal/timeout/timeout_monitor.hpp"

#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace execmon::timeout {

using model::TimerPhase;
using observability::BoolField;
using observability::IntField;
using observability::LogEvent;
using observability::SecondsField;
using observability::StringField;

namespace {

observability::LogField CountField(model::SequenceNumber sequence) {
  return IntField("count", static_cast<std::int64_t>(sequence));
}

} // namespace

TimeoutMonitor::TimeoutMonitor(const config::MonitorConfig& config, std::shared_ptr<scheduler::DeadlineScheduler> scheduler,
                               std::shared_ptr<kernel::InterruptHandle> interrupter,
                               std::shared_ptr<publish::MetadataPublisher> publisher, std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      scheduler_(std::move(scheduler)),
      interrupter_(std::move(interrupter)),
      publisher_(std::move(publisher)),
      logger_(std::move(logger)) {
  observability::Log(*logger_, spdlog::level::info, "Execution timeout monitor initialized",
                     {SecondsField("warning", config_.warning_threshold_seconds, 2),
                      SecondsField("timeout", config_.timeout_threshold_seconds, 2),
                      BoolField("auto_interrupt", config_.auto_interrupt_enabled)});
}

TimeoutMonitor::~TimeoutMonitor() {
  for (auto& state : table_.RemoveAll()) {
    Disarm(*state);
  }
}

// ------------------------------------------------------------
// Arm
// ------------------------------------------------------------

void TimeoutMonitor::OnPreExecute(model::SequenceNumber sequence, std::string_view code_preview) {
  try {
    // At most one execution is in flight; anything left is from a missed post-execute.
    for (auto& stale : table_.RemoveAll()) {
      observability::Log(*logger_, spdlog::level::warn, "Disarming timer state of an unfinished execution",
                         {CountField(stale->execution_ref)});
      Disarm(*stale);
    }

    active_.store(sequence);

    if (!config_.WarningEnabled() && !config_.TimeoutEnabled()) {
      return;
    }

    auto state           = std::make_shared<TimerState>();
    state->execution_ref = sequence;
    state->start_time    = util::Now();
    state->code_preview  = model::MakeSourcePreview(code_preview, model::kLogPreviewLength);
    if (config_.WarningEnabled()) {
      state->warning_deadline = state->start_time + util::FromSeconds(config_.warning_threshold_seconds);
    }
    if (config_.TimeoutEnabled()) {
      state->timeout_deadline = state->start_time + util::FromSeconds(config_.timeout_threshold_seconds);
    }

    std::weak_ptr<TimeoutMonitor> weak = weak_from_this();

    // Held until both timer ids are recorded; an early callback waits here.
    std::lock_guard lock(state->mutex);
    table_.Insert(state);

    try {
      if (config_.WarningEnabled()) {
        state->warning_timer = scheduler_->ScheduleAt(state->warning_deadline, [weak, sequence] {
          if (auto self = weak.lock()) self->OnWarningDeadline(sequence);
        });
      }
      if (config_.TimeoutEnabled()) {
        state->timeout_timer = scheduler_->ScheduleAt(state->timeout_deadline, [weak, sequence] {
          if (auto self = weak.lock()) self->OnTimeoutDeadline(sequence);
        });
      }
    } catch (const std::exception& e) {
      table_.Remove(sequence);
      if (state->warning_timer) scheduler_->Cancel(*state->warning_timer);
      state->warning_timer.reset();
      state->phase = TimerPhase::kDisarmed;
      degraded_.fetch_add(1);
      observability::Log(*logger_, spdlog::level::warn, "Timeout monitoring degraded, execution runs unmonitored",
                         {CountField(sequence), StringField("error", e.what())});
      return;
    }

    armed_.fetch_add(1);
    observability::Log(*logger_, spdlog::level::debug, "Timeout monitoring started",
                       {CountField(sequence), SecondsField("warning", config_.warning_threshold_seconds, 2),
                        SecondsField("timeout", config_.timeout_threshold_seconds, 2),
                        BoolField("auto_interrupt", config_.auto_interrupt_enabled)});
  } catch (const std::exception& e) {
    observability::Log(*logger_, spdlog::level::err, "Timeout monitor failed to arm",
                       {CountField(sequence), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Disarm
// ------------------------------------------------------------

void TimeoutMonitor::OnPostExecute(model::SequenceNumber sequence) {
  try {
    auto state = table_.Remove(sequence);
    if (!state) {
      auto expected = sequence;
      active_.compare_exchange_strong(expected, model::kUnknownSequence);
      return;
    }

    Disarm(*state);
    observability::Log(*logger_, spdlog::level::debug, "Timeout monitoring disarmed", {CountField(sequence)});
  } catch (const std::exception& e) {
    observability::Log(*logger_, spdlog::level::err, "Timeout monitor failed to disarm",
                       {CountField(sequence), StringField("error", e.what())});
  }
}

void TimeoutMonitor::Disarm(TimerState& state) {
  std::optional<scheduler::TimerId> warning_timer;
  std::optional<scheduler::TimerId> timeout_timer;
  {
    std::lock_guard lock(state.mutex);
    state.phase = TimerPhase::kDisarmed;
    warning_timer.swap(state.warning_timer);
    timeout_timer.swap(state.timeout_timer);

    auto expected = state.execution_ref;
    active_.compare_exchange_strong(expected, model::kUnknownSequence);
  }

  // Fire-and-forget: a callback already running finds the phase DISARMED.
  if (warning_timer) scheduler_->Cancel(*warning_timer);
  if (timeout_timer) scheduler_->Cancel(*timeout_timer);
}

// ------------------------------------------------------------
// Deadline callbacks
// ------------------------------------------------------------

void TimeoutMonitor::OnWarningDeadline(model::SequenceNumber sequence) {
  auto state = table_.Find(sequence);
  if (!state) return;

  std::lock_guard lock(state->mutex);
  if (!model::CanTransition(state->phase, TimerPhase::kWarned)) return;

  state->phase = TimerPhase::kWarned;
  state->warning_timer.reset();

  const double elapsed = util::SecondsBetween(state->start_time, util::Now());
  LogEvent(*logger_, spdlog::level::warn, "LONG_EXECUTION",
           {CountField(sequence), SecondsField("elapsed", elapsed, 1),
            SecondsField("threshold", config_.warning_threshold_seconds, 2)});
  warnings_.fetch_add(1);

  if (publisher_) {
    publisher_->PublishNotice(model::ExecutionNotice{sequence, model::NoticeKind::kWarning, elapsed,
                                                     config_.warning_threshold_seconds, state->code_preview});
  }
}

void TimeoutMonitor::OnTimeoutDeadline(model::SequenceNumber sequence) {
  auto state = table_.Find(sequence);
  if (!state) return;

  std::lock_guard lock(state->mutex);
  if (!model::CanTransition(state->phase, TimerPhase::kTimedOut)) return;

  state->phase = TimerPhase::kTimedOut;
  state->timeout_timer.reset();

  const double elapsed = util::SecondsBetween(state->start_time, util::Now());
  LogEvent(*logger_, spdlog::level::err, "TIMEOUT_INTERRUPT", {CountField(sequence), SecondsField("elapsed", elapsed, 1)});
  escalations_.fetch_add(1);

  if (publisher_) {
    publisher_->PublishNotice(model::ExecutionNotice{sequence, model::NoticeKind::kTimeout, elapsed,
                                                     config_.timeout_threshold_seconds, state->code_preview});
  }

  if (!config_.auto_interrupt_enabled) {
    observability::Log(*logger_, spdlog::level::info, "Auto-interrupt disabled, execution left running", {CountField(sequence)});
    return;
  }

  DeliverInterrupt(*state, elapsed);
}

// Caller holds state.mutex.
void TimeoutMonitor::DeliverInterrupt(TimerState& state, double elapsed) {
  const auto active = active_.load();
  if (active != state.execution_ref) {
    suppressed_interrupts_.fetch_add(1);
    observability::Log(*logger_, spdlog::level::warn, "Suppressed interrupt for stale execution",
                       {CountField(state.execution_ref), IntField("active", static_cast<std::int64_t>(active))});
    return;
  }

  state.phase = TimerPhase::kInterrupted;
  interrupt_requests_.fetch_add(1);

  // Never retried: a second attempt could land on a later execution.
  try {
    if (!interrupter_ || !interrupter_->InterruptCurrentExecution()) {
      observability::Log(*logger_, spdlog::level::err, "Failed to deliver interrupt, no execution accepted it",
                         {CountField(state.execution_ref)});
      return;
    }
    observability::Log(*logger_, spdlog::level::warn, "Interrupt requested for execution",
                       {CountField(state.execution_ref), SecondsField("elapsed", elapsed, 1)});
  } catch (const std::exception& e) {
    observability::Log(*logger_, spdlog::level::err, "Failed to deliver interrupt",
                       {CountField(state.execution_ref), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Introspection
// ------------------------------------------------------------

std::optional<model::TimerPhase> TimeoutMonitor::PhaseOf(model::SequenceNumber sequence) const {
  auto state = table_.Find(sequence);
  if (!state) return std::nullopt;

  std::lock_guard lock(state->mutex);
  return state->phase;
}

std::size_t TimeoutMonitor::InFlight() const {
  return table_.Size();
}

MonitorStats TimeoutMonitor::Stats() const {
  MonitorStats stats;
  stats.armed                 = armed_.load();
  stats.warnings              = warnings_.load();
  stats.escalations           = escalations_.load();
  stats.interrupt_requests    = interrupt_requests_.load();
  stats.suppressed_interrupts = suppressed_interrupts_.load();
  stats.degraded              = degraded_.load();
  return stats;
}

} // namespace execmon::timeout
