#include "deadline_scheduler.hpp"

#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace execmon::scheduler {

using observability::IntField;
using observability::StringField;

DeadlineScheduler::DeadlineScheduler(std::shared_ptr<spdlog::logger> logger, std::size_t capacity)
    : logger_(std::move(logger)), capacity_(capacity), queue_(std::make_shared<Queue>()) {
}

DeadlineScheduler::~DeadlineScheduler() {
  Stop();
}

void DeadlineScheduler::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&DeadlineScheduler::Run, queue_, logger_);
}

void DeadlineScheduler::Stop() {
  {
    std::lock_guard lock(queue_->mutex);
    queue_->shutdown = true;
    queue_->pending.clear();
  }
  queue_->cv.notify_all();
  running_ = false;

  if (!thread_.joinable()) return;

  if (thread_.get_id() == std::this_thread::get_id()) {
    thread_.detach();
    return;
  }
  thread_.join();
}

TimerId DeadlineScheduler::ScheduleAt(util::TimePoint deadline, Callback callback) {
  TimerId id = 0;
  {
    std::lock_guard lock(queue_->mutex);
    if (queue_->shutdown) {
      throw util::InvalidState("deadline scheduler is stopped");
    }
    if (queue_->pending.size() >= capacity_) {
      throw util::ResourceExhausted("deadline scheduler is full (" + std::to_string(capacity_) + " pending timers)");
    }

    if (queue_->heap.size() > 4 * (queue_->pending.size() + 16)) {
      queue_->CompactLocked();
    }

    id = queue_->next_id++;
    queue_->pending.emplace(id, std::move(callback));
    queue_->heap.push(Entry{deadline, id});
  }
  queue_->cv.notify_one();
  return id;
}

TimerId DeadlineScheduler::ScheduleAfter(util::Clock::duration delay, Callback callback) {
  return ScheduleAt(util::Now() + delay, std::move(callback));
}

bool DeadlineScheduler::Cancel(TimerId id) {
  std::lock_guard lock(queue_->mutex);
  // The heap entry stays behind and is skipped when it surfaces.
  return queue_->pending.erase(id) > 0;
}

std::size_t DeadlineScheduler::Pending() const {
  std::lock_guard lock(queue_->mutex);
  return queue_->pending.size();
}

// Drops heap entries left behind by Cancel().
void DeadlineScheduler::Queue::CompactLocked() {
  std::vector<Entry> live;
  live.reserve(pending.size());
  while (!heap.empty()) {
    if (pending.count(heap.top().id) > 0) live.push_back(heap.top());
    heap.pop();
  }
  for (const auto& entry : live) heap.push(entry);
}

void DeadlineScheduler::Run(std::shared_ptr<Queue> queue, std::shared_ptr<spdlog::logger> logger) {
  std::unique_lock lock(queue->mutex);

  while (!queue->shutdown) {
    if (queue->heap.empty()) {
      queue->cv.wait(lock, [&] { return queue->shutdown || !queue->heap.empty(); });
      continue;
    }

    const Entry next = queue->heap.top();
    auto        it   = queue->pending.find(next.id);
    if (it == queue->pending.end()) {
      queue->heap.pop();
      continue;
    }

    if (next.deadline > util::Now()) {
      // Wakes early on a new earlier deadline or shutdown; the loop re-checks.
      queue->cv.wait_until(lock, next.deadline);
      continue;
    }

    queue->heap.pop();
    Callback callback = std::move(it->second);
    queue->pending.erase(it);

    lock.unlock();
    try {
      callback();
    } catch (const std::exception& e) {
      observability::Log(*logger, spdlog::level::err, "Deadline callback failed",
                         {IntField("timer_id", static_cast<std::int64_t>(next.id)), StringField("error", e.what())});
    }
    // Release captured owners before relocking; their destructors may call back in.
    callback = nullptr;
    lock.lock();
  }
}

} // namespace execmon::scheduler
