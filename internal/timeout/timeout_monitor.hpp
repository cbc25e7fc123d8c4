#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/logger.h>

#include "internal/config/monitor_config.hpp"
#include "internal/kernel/interrupt_handle.hpp"
#include "internal/model/execution_record.hpp"
#include "internal/model/timer_phase.hpp"
#include "internal/publish/metadata_publisher.hpp"
#include "internal/scheduler/deadline_scheduler.hpp"
#include "internal/timeout/timer_table.hpp"

namespace execmon::timeout {

struct MonitorStats {
  std::uint64_t armed{0};
  std::uint64_t warnings{0};
  std::uint64_t escalations{0};
  std::uint64_t interrupt_requests{0};
  std::uint64_t suppressed_interrupts{0};
  std::uint64_t degraded{0};
};

/*
  Detects executions that outlive the configured thresholds.

  OnPreExecute/OnPostExecute run on the execution thread; the deadline
  callbacks run on the scheduler thread. Each execution's transitions are
  serialized by its TimerState mutex:

    ARMED -> WARNED -> TIMED_OUT -> INTERRUPTED, DISARMED from anywhere

  Once DISARMED nothing fires, logs or mutates. An interrupt is only sent
  while the execution it was armed for is still the active one.

  Must be owned by a std::shared_ptr: scheduled callbacks hold a weak
  reference and become no-ops once the monitor is gone.
*/
class TimeoutMonitor : public std::enable_shared_from_this<TimeoutMonitor> {
 public:
  TimeoutMonitor(const config::MonitorConfig& config, std::shared_ptr<scheduler::DeadlineScheduler> scheduler,
                 std::shared_ptr<kernel::InterruptHandle> interrupter, std::shared_ptr<publish::MetadataPublisher> publisher,
                 std::shared_ptr<spdlog::logger> logger);
  ~TimeoutMonitor();

  TimeoutMonitor(const TimeoutMonitor&)            = delete;
  TimeoutMonitor& operator=(const TimeoutMonitor&) = delete;

  // Never throws; a scheduling failure leaves this execution unmonitored.
  void OnPreExecute(model::SequenceNumber sequence, std::string_view code_preview);

  // Disarms without waiting for a callback that is already running elsewhere.
  void OnPostExecute(model::SequenceNumber sequence);

  // Deadline callbacks. Public so a late delivery can be replayed directly.
  void OnWarningDeadline(model::SequenceNumber sequence);
  void OnTimeoutDeadline(model::SequenceNumber sequence);

  std::optional<model::TimerPhase> PhaseOf(model::SequenceNumber sequence) const;
  std::size_t                      InFlight() const;
  MonitorStats                     Stats() const;

  const config::MonitorConfig& Config() const {
    return config_;
  }

 private:
  void Disarm(TimerState& state);
  void DeliverInterrupt(TimerState& state, double elapsed);

  const config::MonitorConfig                   config_;
  std::shared_ptr<scheduler::DeadlineScheduler> scheduler_;
  std::shared_ptr<kernel::InterruptHandle>      interrupter_;
  std::shared_ptr<publish::MetadataPublisher>   publisher_;
  std::shared_ptr<spdlog::logger>               logger_;

  TimerTable table_;

  // Sequence number of the running execution, kUnknownSequence between
  // executions. Cleared under the execution's TimerState mutex.
  std::atomic<model::SequenceNumber> active_{model::kUnknownSequence};

  std::atomic<std::uint64_t> armed_{0};
  std::atomic<std::uint64_t> warnings_{0};
  std::atomic<std::uint64_t> escalations_{0};
  std::atomic<std::uint64_t> interrupt_requests_{0};
  std::atomic<std::uint64_t> suppressed_interrupts_{0};
  std::atomic<std::uint64_t> degraded_{0};
};

} // namespace execmon::timeout
