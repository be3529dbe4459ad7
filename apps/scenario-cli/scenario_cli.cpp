/**
 * @file scenario_cli.cpp
 * @brief Single-effect deflection scenario CLI on a virtual clock.
 * @author Watosn
 */

#include <cmath>
#include <cstdlib>
#include <cstddef>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "deflectsim/scene/effect_orchestrator.hpp"

namespace {

std::string event_list(const std::vector<deflectsim::scene::LifecycleEvent>& events) {
  std::string s;
  for (const auto& e : events) {
    if (!s.empty()) {
      s += ';';
    }
    s += deflectsim::scene::lifecycle_event_name(e.kind);
    if (e.effect.has_value()) {
      s += fmt::format("({})", deflectsim::scene::effect_key_name(*e.effect));
    }
  }
  return s;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2 || argc > 6) {
    spdlog::error(
        "usage: deflect_scenario_cli <effect:kineticImpactor|nuclearDetonation|gravityTractor|laserAblation|ionBeamShepherd|analyze> [duration_s] [tick_hz] [nuclear_yield_mt] [log_level]");
    return 1;
  }

  const std::string effect_s = argv[1];
  const double duration_s = (argc >= 3) ? std::atof(argv[2]) : 25.0;
  const double tick_hz = (argc >= 4) ? std::atof(argv[3]) : 60.0;
  const double yield_mt = (argc >= 5) ? std::atof(argv[4]) : 0.5;
  if (argc >= 6) {
    spdlog::set_level(spdlog::level::from_str(argv[5]));
  }

  const auto key = deflectsim::scene::parse_effect_key(effect_s);
  if (!key.has_value()) {
    spdlog::error("invalid effect: {}", effect_s);
    return 2;
  }
  if (!(duration_s > 0.0) || !(tick_hz > 0.0)) {
    spdlog::error("duration_s and tick_hz must be positive");
    return 2;
  }

  deflectsim::scene::EffectOrchestrator::Config config{};
  config.engines.nuclear_detonation.yield_mt = yield_mt;
  deflectsim::scene::EffectOrchestrator orchestrator(config);
  if (orchestrator.config_status() != deflectsim::core::Status::Ok) {
    spdlog::error("orchestrator config rejected: status={}", static_cast<int>(orchestrator.config_status()));
    return 3;
  }

  orchestrator.set_requested(*key, true);

  const double dt = 1.0 / tick_hz;
  const auto ticks = static_cast<long>(std::ceil(duration_s * tick_hz));
  const auto technique = deflectsim::scene::to_technique(*key);
  const auto slot = technique.has_value() ? static_cast<std::size_t>(*technique) : 0U;

  fmt::print("t_s,phase,offset_x,offset_y,offset_z,visible,scan_pct,events\n");
  for (long i = 0; i <= ticks; ++i) {
    const double now_s = static_cast<double>(i) * dt;
    const auto r = orchestrator.tick(now_s);
    const auto& engine = r.engines[slot];
    const std::string phase = (technique.has_value() && engine.has_value())
                                  ? std::string(deflectsim::effects::phase_name(engine->phase))
                                  : std::string("-");
    fmt::print("{:.4f},{},{:.6f},{:.6f},{:.6f},{},{:.1f},{}\n", now_s, phase, r.asteroid.deflection_offset_m.x,
               r.asteroid.deflection_offset_m.y, r.asteroid.deflection_offset_m.z, r.asteroid.visible ? 1 : 0,
               r.scan.progress_percent, event_list(r.events));
  }
  return 0;
}
