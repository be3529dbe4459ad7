/**
 * @file deflection_accumulator.hpp
 * @brief Owner of the asteroid base position and accumulated deflection offset.
 * @author Watosn
 */
#pragma once

#include "deflectsim/core/types.hpp"

namespace deflectsim::scene {

/**
 * @brief Additive-only store for the asteroid deflection offset.
 *
 * The offset changes only through `apply_delta` and `reset`; the world position is derived
 * from the fixed base position on every read.
 */
class DeflectionAccumulator final {
 public:
  explicit DeflectionAccumulator(deflectsim::core::Vec3 base_position) : base_position_(base_position) {}

  /**
   * @brief Add one engine delta to the offset.
   */
  void apply_delta(const deflectsim::core::Vec3& delta);
  /**
   * @brief Set the offset back to the zero vector.
   */
  void reset() { offset_ = deflectsim::core::Vec3{}; }

  [[nodiscard]] deflectsim::core::Vec3 current_offset() const { return offset_; }
  [[nodiscard]] const deflectsim::core::Vec3& base_position() const { return base_position_; }
  [[nodiscard]] deflectsim::core::Vec3 world_position() const { return base_position_ + offset_; }

 private:
  const deflectsim::core::Vec3 base_position_{};
  deflectsim::core::Vec3 offset_{};
};

}  // namespace deflectsim::scene
