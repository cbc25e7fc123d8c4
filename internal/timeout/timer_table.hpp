#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/timeout/timer_state.hpp"

namespace execmon::timeout {

/*
  In-flight timer states indexed by sequence number.

  Deadline callbacks hold a sequence number, never a pointer; a callback
  whose entry is gone has nothing to do. The table lock only covers
  insert/find/remove, never a phase transition.
*/
class TimerTable {
 public:
  // Throws util::InvalidState if the sequence number is already present.
  void Insert(std::shared_ptr<TimerState> state);

  std::shared_ptr<TimerState> Find(model::SequenceNumber sequence) const;

  // Returns the removed entry, nullptr if absent.
  std::shared_ptr<TimerState> Remove(model::SequenceNumber sequence);

  std::vector<std::shared_ptr<TimerState>> RemoveAll();

  std::size_t Size() const;

 private:
  mutable std::mutex mutex_;

  std::unordered_map<model::SequenceNumber, std::shared_ptr<TimerState>> states_;
};

} // namespace execmon::timeout
