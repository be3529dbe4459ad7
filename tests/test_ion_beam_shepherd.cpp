/**
 * @file test_ion_beam_shepherd.cpp
 * @brief Ion beam shepherd engine checks.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>

#include <spdlog/spdlog.h>

#include "deflectsim/effects/continuous/ion_beam_shepherd.hpp"

namespace {

bool approx(double a, double b, double rel = 1e-12) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

}  // namespace

int main() {
  using deflectsim::core::Vec3;
  using deflectsim::effects::EngineInput;
  using deflectsim::effects::IonBeamShepherdEngine;
  using deflectsim::effects::Phase;

  IonBeamShepherdEngine engine;
  if (!approx(engine.force_at(0.0), 0.08) || !approx(engine.force_at(1.0), 0.12) || !approx(engine.force_at(2.0), 0.12)) {
    spdlog::error("force ramp mismatch");
    return 1;
  }
  if (engine.total_duration_s() != 16.0) {
    spdlog::error("total duration should be approach + shepherd");
    return 2;
  }

  const Vec3 asteroid{35.0, 0.0, 0.0};
  const Vec3 station_offset{-8.0, 3.0, 2.0};
  const double offset_norm = deflectsim::core::norm(station_offset);

  int deltas = 0;
  int completions = 0;
  double first_mag = -1.0;
  double last_mag = -1.0;
  for (int i = 0; i <= 200; ++i) {
    const double t = i / 10.0;
    const auto out = engine.tick(EngineInput{.asteroid_world_position = asteroid, .is_active = true, .now_s = t});
    if (i == 0 && !approx(out.visual.spacecraft_position.x, 25.0)) {
      spdlog::error("approach should start on the launch shell");
      return 3;
    }
    if (t < 4.0 && (out.phase != Phase::Approach || out.deflection_delta.has_value())) {
      spdlog::error("approach must not deflect (t={})", t);
      return 4;
    }
    if (out.deflection_delta.has_value()) {
      ++deltas;
      const auto& d = *out.deflection_delta;
      const double mag = deflectsim::core::norm(d);
      // Push runs from the parked spacecraft to the asteroid, i.e. opposite the station offset.
      const double cos_angle = deflectsim::core::dot(d, station_offset) / (mag * offset_norm);
      if (!approx(cos_angle, -1.0, 1e-9) || !out.visual.beam_visible || out.phase != Phase::Beam) {
        spdlog::error("beam push direction mismatch at t={}", t);
        return 5;
      }
      if (first_mag < 0.0) {
        first_mag = mag;
      }
      if (mag < last_mag) {
        spdlog::error("beam force should not decrease");
        return 6;
      }
      last_mag = mag;
    }
    if (out.completed) {
      ++completions;
      if (t != 16.0) {
        spdlog::error("completion at wrong time t={}", t);
        return 7;
      }
    }
    if (t >= 16.0 && out.deflection_delta.has_value()) {
      spdlog::error("delta after completion");
      return 8;
    }
  }

  if (completions != 1 || deltas != 120) {
    spdlog::error("expected 120 deltas and 1 completion, got {} and {}", deltas, completions);
    return 9;
  }
  if (!approx(first_mag, 0.08) || !(last_mag > first_mag) || !(last_mag < 0.12)) {
    spdlog::error("force ramp over the beam phase mismatch: first={} last={}", first_mag, last_mag);
    return 10;
  }

  return 0;
}
