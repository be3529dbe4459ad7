/**
 * @file test_deflection_accumulator.cpp
 * @brief Deflection offset accumulation checks.
 * @author Watosn
 */

#include <limits>

#include <spdlog/spdlog.h>

#include "deflectsim/scene/deflection_accumulator.hpp"

int main() {
  using deflectsim::core::Vec3;
  using deflectsim::scene::DeflectionAccumulator;

  const Vec3 base{35.0, 0.0, 0.0};
  const Vec3 a{0.5, -0.25, 1.0};
  const Vec3 b{-2.0, 0.125, 0.0};
  const Vec3 c{0.0625, 4.0, -0.5};

  DeflectionAccumulator forward(base);
  forward.apply_delta(a);
  forward.apply_delta(b);
  forward.apply_delta(c);

  DeflectionAccumulator shuffled(base);
  shuffled.apply_delta(c);
  shuffled.apply_delta(a);
  shuffled.apply_delta(b);

  if (forward.current_offset() != shuffled.current_offset()) {
    spdlog::error("accumulation order changed the offset");
    return 1;
  }
  if (forward.world_position() != base + forward.current_offset()) {
    spdlog::error("world position must equal base + offset");
    return 2;
  }

  forward.apply_delta(Vec3{std::numeric_limits<double>::quiet_NaN(), 0.0, 0.0});
  forward.apply_delta(Vec3{0.0, std::numeric_limits<double>::infinity(), 0.0});
  if (forward.current_offset() != shuffled.current_offset()) {
    spdlog::error("non-finite delta should be ignored");
    return 3;
  }

  forward.reset();
  if (forward.current_offset() != Vec3{} || forward.world_position() != base || forward.base_position() != base) {
    spdlog::error("reset should restore the exact zero offset");
    return 4;
  }

  return 0;
}
