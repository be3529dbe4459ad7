/**
 * @file deflection_accumulator.cpp
 * @brief Deflection offset accumulation.
 * @author Watosn
 */

#include "deflectsim/scene/deflection_accumulator.hpp"

#include <cmath>

#include <spdlog/spdlog.h>

namespace deflectsim::scene {

void DeflectionAccumulator::apply_delta(const deflectsim::core::Vec3& delta) {
  if (!std::isfinite(delta.x) || !std::isfinite(delta.y) || !std::isfinite(delta.z)) {
    spdlog::warn("ignoring non-finite deflection delta ({}, {}, {})", delta.x, delta.y, delta.z);
    return;
  }
  offset_ += delta;
}

}  // namespace deflectsim::scene
