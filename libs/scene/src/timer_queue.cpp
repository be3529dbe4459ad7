/**
 * @file timer_queue.cpp
 * @brief Logical timer queue implementation.
 * @author Watosn
 */

#include "deflectsim/scene/timer_queue.hpp"

namespace deflectsim::scene {

void TimerQueue::schedule(const ScheduledAction& action) {
  entries_.push(Entry{.action = action, .sequence = next_sequence_++});
}

std::vector<ScheduledAction> TimerQueue::pop_due(double now_s) {
  std::vector<ScheduledAction> due;
  while (!entries_.empty() && entries_.top().action.due_s <= now_s) {
    due.push_back(entries_.top().action);
    entries_.pop();
  }
  return due;
}

std::optional<double> TimerQueue::next_due_s() const {
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_.top().action.due_s;
}

}  // namespace deflectsim::scene
