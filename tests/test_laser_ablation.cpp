/**
 * @file test_laser_ablation.cpp
 * @brief Laser ablation engine checks.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "deflectsim/effects/continuous/laser_ablation.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using deflectsim::core::Vec3;
  using deflectsim::effects::EngineInput;
  using deflectsim::effects::LaserAblationEngine;
  using deflectsim::effects::Phase;

  LaserAblationEngine engine;
  const Vec3 asteroid{35.0, 0.0, 0.0};

  int deltas = 0;
  int completions = 0;
  for (int i = 0; i <= 120; ++i) {
    const double t = i / 10.0;
    const auto out = engine.tick(EngineInput{.asteroid_world_position = asteroid, .is_active = true, .now_s = t});
    if (t < 1.0 && (out.phase != Phase::Targeting || out.visual.beam_visible || out.deflection_delta.has_value())) {
      spdlog::error("targeting phase mismatch at t={}", t);
      return 1;
    }
    if (i == 20 && (out.phase != Phase::Beam || !approx(out.visual.beam_intensity, 1.0))) {
      spdlog::error("beam should be at full intensity after the ramp");
      return 2;
    }
    if (out.deflection_delta.has_value()) {
      ++deltas;
      const auto& d = *out.deflection_delta;
      if (!approx(d.x, 0.03) || !approx(d.y, 0.0) || !approx(d.z, 0.0)) {
        spdlog::error("ablation push should point away from the platform");
        return 3;
      }
      if (t >= engine.total_duration_s()) {
        spdlog::error("delta after beam end at t={}", t);
        return 4;
      }
    }
    if (out.completed) {
      ++completions;
      if (t < engine.total_duration_s()) {
        spdlog::error("completed early at t={}", t);
        return 5;
      }
    }
  }
  if (completions != 1 || deltas != 80) {
    spdlog::error("expected 80 deltas and 1 completion, got {} and {}", deltas, completions);
    return 6;
  }

  const LaserAblationEngine bad(LaserAblationEngine::Config{.min_emission_interval_s = 0.0});
  if (bad.config_status() != deflectsim::core::Status::InvalidInput) {
    spdlog::error("zero emission interval should be rejected");
    return 7;
  }

  return 0;
}
