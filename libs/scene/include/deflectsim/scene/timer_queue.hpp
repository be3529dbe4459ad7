/**
 * @file timer_queue.hpp
 * @brief Logical timer queue for deferred scene actions.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <queue>
#include <vector>

#include "deflectsim/effects/core/phase_engine.hpp"

namespace deflectsim::scene {

/**
 * @brief Deferred action kinds executed by the orchestrator.
 */
enum class ScheduledActionKind : std::uint8_t { ResetOffset, ShowAsteroid };

/**
 * @brief One deferred action, due at an absolute clock reading.
 */
struct ScheduledAction {
  double due_s{};
  ScheduledActionKind kind{ScheduledActionKind::ResetOffset};
  deflectsim::effects::Technique source{deflectsim::effects::Technique::KineticImpactor};
};

/**
 * @brief Min-ordered queue of scheduled actions driven by a caller-supplied clock.
 *
 * Actions due at the same time are returned in scheduling order.
 */
class TimerQueue final {
 public:
  void schedule(const ScheduledAction& action);
  /**
   * @brief Remove and return every action with `due_s <= now_s`, earliest first.
   */
  [[nodiscard]] std::vector<ScheduledAction> pop_due(double now_s);
  [[nodiscard]] std::optional<double> next_due_s() const;
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }

 private:
  struct Entry {
    ScheduledAction action{};
    std::uint64_t sequence{};
  };
  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.action.due_s != b.action.due_s) {
        return a.action.due_s > b.action.due_s;
      }
      return a.sequence > b.sequence;
    }
  };

  std::priority_queue<Entry, std::vector<Entry>, Later> entries_{};
  std::uint64_t next_sequence_{};
};

}  // namespace deflectsim::scene
