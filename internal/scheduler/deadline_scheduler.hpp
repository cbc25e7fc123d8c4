#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "internal/util/time.hpp"

namespace execmon::scheduler {

using TimerId = std::uint64_t;

/*
  Background timing facility.

  A single timer thread runs deferred callbacks in deadline order.
  Cancel() is fire-and-forget: it drops a pending callback and never waits
  for one that is already running.
*/
class DeadlineScheduler {
 public:
  using Callback = std::function<void()>;

  DeadlineScheduler(std::shared_ptr<spdlog::logger> logger, std::size_t capacity);
  ~DeadlineScheduler();

  DeadlineScheduler(const DeadlineScheduler&)            = delete;
  DeadlineScheduler& operator=(const DeadlineScheduler&) = delete;

  void Start();
  void Stop();

  // Throws util::ResourceExhausted at capacity, util::InvalidState once stopped.
  TimerId ScheduleAt(util::TimePoint deadline, Callback callback);
  TimerId ScheduleAfter(util::Clock::duration delay, Callback callback);

  // True when the callback was still pending and will not run.
  bool Cancel(TimerId id);

  std::size_t Pending() const;

 private:
  struct Entry {
    util::TimePoint deadline;
    TimerId         id;
  };

  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.deadline != b.deadline) return a.deadline > b.deadline;
      return a.id > b.id;
    }
  };

  // Shared with the timer thread, which may outlive the scheduler when the
  // last owner lets go from inside a callback.
  struct Queue {
    std::mutex                                            mutex;
    std::condition_variable                               cv;
    std::priority_queue<Entry, std::vector<Entry>, Later> heap;
    std::unordered_map<TimerId, Callback>                 pending;
    TimerId                                               next_id  = 1;
    bool                                                  shutdown = false;

    void CompactLocked();
  };

  static void Run(std::shared_ptr<Queue> queue, std::shared_ptr<spdlog::logger> logger);

  std::shared_ptr<spdlog::logger> logger_;
  const std::size_t               capacity_;
  std::shared_ptr<Queue>          queue_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace execmon::scheduler
