/**
 * @file test_nuclear_detonation.cpp
 * @brief Nuclear detonation engine checks: deflect vs destroy outcomes.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "deflectsim/effects/impulsive/nuclear_detonation.hpp"

namespace {

bool approx(double a, double b, double tol = 1e-12) { return std::abs(a - b) <= tol; }

struct RunSummary {
  int deltas{};
  int completions{};
  int destructions{};
  deflectsim::core::Vec3 total{};
  deflectsim::effects::Phase last_phase{deflectsim::effects::Phase::Idle};
};

RunSummary run(deflectsim::effects::NuclearDetonationEngine& engine) {
  RunSummary s{};
  for (int i = 0; i <= 80; ++i) {
    const auto out = engine.tick(deflectsim::effects::EngineInput{
        .asteroid_world_position = deflectsim::core::Vec3{35.0, 0.0, 0.0}, .is_active = true, .now_s = i / 10.0});
    if (out.deflection_delta.has_value()) {
      ++s.deltas;
      s.total += *out.deflection_delta;
    }
    s.completions += out.completed ? 1 : 0;
    s.destructions += out.destroyed ? 1 : 0;
    s.last_phase = out.phase;
  }
  return s;
}

}  // namespace

int main() {
  using deflectsim::effects::NuclearDetonationEngine;
  using deflectsim::effects::Phase;

  NuclearDetonationEngine deflect;
  if (deflect.disrupts()) {
    spdlog::error("default yield should deflect");
    return 1;
  }
  const auto d = run(deflect);
  if (d.completions != 1 || d.destructions != 0 || d.deltas != 1 || d.last_phase != Phase::Complete) {
    spdlog::error("deflect run mismatch: completions={} destructions={} deltas={}", d.completions, d.destructions,
                  d.deltas);
    return 2;
  }
  // Burst at (33, 1, 0) pushes along (2, -1, 0).
  const double n = std::sqrt(5.0);
  if (!approx(d.total.x, 5.0 * 2.0 / n) || !approx(d.total.y, -5.0 / n) || !approx(d.total.z, 0.0)) {
    spdlog::error("deflection direction mismatch");
    return 3;
  }

  NuclearDetonationEngine destroy(NuclearDetonationEngine::Config{.yield_mt = 2.0});
  if (!destroy.disrupts()) {
    spdlog::error("high yield should disrupt");
    return 4;
  }
  const auto x = run(destroy);
  if (x.destructions != 1 || x.completions != 0 || x.deltas != 0 || x.last_phase != Phase::Destroyed) {
    spdlog::error("destroy run mismatch: completions={} destructions={} deltas={}", x.completions, x.destructions,
                  x.deltas);
    return 5;
  }

  NuclearDetonationEngine threshold(NuclearDetonationEngine::Config{.yield_mt = 1.0, .disruption_threshold_mt = 1.0});
  if (!threshold.disrupts()) {
    spdlog::error("yield at threshold should disrupt");
    return 6;
  }

  const NuclearDetonationEngine bad(NuclearDetonationEngine::Config{.disruption_threshold_mt = 0.0});
  if (bad.config_status() != deflectsim::core::Status::InvalidInput) {
    spdlog::error("zero threshold should be rejected");
    return 7;
  }

  return 0;
}
