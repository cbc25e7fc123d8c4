#include "timer_table.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace execmon::timeout {

void TimerTable::Insert(std::shared_ptr<TimerState> state) {
  std::lock_guard lock(mutex_);

  const auto sequence = state->execution_ref;
  if (!states_.emplace(sequence, std::move(state)).second) {
    throw util::InvalidState("timer state already armed for execution " + std::to_string(sequence));
  }
}

std::shared_ptr<TimerState> TimerTable::Find(model::SequenceNumber sequence) const {
  std::lock_guard lock(mutex_);

  auto it = states_.find(sequence);
  if (it == states_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<TimerState> TimerTable::Remove(model::SequenceNumber sequence) {
  std::lock_guard lock(mutex_);

  auto it = states_.find(sequence);
  if (it == states_.end()) return nullptr;

  auto state = std::move(it->second);
  states_.erase(it);
  return state;
}

std::vector<std::shared_ptr<TimerState>> TimerTable::RemoveAll() {
  std::lock_guard lock(mutex_);

  std::vector<std::shared_ptr<TimerState>> removed;
  removed.reserve(states_.size());
  for (auto& entry : states_) {
    removed.push_back(std::move(entry.second));
  }
  states_.clear();
  return removed;
}

std::size_t TimerTable::Size() const {
  std::lock_guard lock(mutex_);
  return states_.size();
}

} // namespace execmon::timeout
