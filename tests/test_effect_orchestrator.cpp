/**
 * @file test_effect_orchestrator.cpp
 * @brief Effect orchestrator lifecycle, cooldown and cancellation checks.
 * @author Watosn
 */

#include <cmath>
#include <cstddef>
#include <vector>

#include <spdlog/spdlog.h>

#include "deflectsim/scene/effect_orchestrator.hpp"

namespace {

using deflectsim::core::Vec3;
using deflectsim::effects::Technique;
using deflectsim::scene::EffectKey;
using deflectsim::scene::EffectOrchestrator;
using deflectsim::scene::LifecycleEvent;
using deflectsim::scene::LifecycleEventKind;
using deflectsim::scene::TickReport;

std::size_t count(const std::vector<LifecycleEvent>& events, LifecycleEventKind kind) {
  std::size_t n = 0;
  for (const auto& e : events) {
    n += (e.kind == kind) ? 1U : 0U;
  }
  return n;
}

void append(std::vector<LifecycleEvent>& all, const TickReport& r) { all.insert(all.end(), r.events.begin(), r.events.end()); }

bool approx(double a, double b, double tol = 1e-9) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  // Gravity tractor: one start, retrigger ignored, one completion, exact-zero reset after cooldown.
  {
    EffectOrchestrator orch;
    std::vector<LifecycleEvent> events;
    orch.set_requested(EffectKey::GravityTractor, true);
    append(events, orch.tick(0.0));
    if (!orch.is_running(Technique::GravityTractor) || count(events, LifecycleEventKind::Started) != 1U) {
      spdlog::error("gravity tractor should start on the first tick");
      return 1;
    }
    orch.set_requested(EffectKey::GravityTractor, false);
    orch.set_requested(EffectKey::GravityTractor, true);

    TickReport before_reset{};
    TickReport at_reset{};
    for (int i = 1; i <= 200; ++i) {
      const auto r = orch.tick(i / 10.0);
      append(events, r);
      if (i == 149) {
        before_reset = r;
      }
      if (i == 150) {
        at_reset = r;
      }
    }
    if (count(events, LifecycleEventKind::IgnoredRetrigger) != 1U || count(events, LifecycleEventKind::Started) != 1U ||
        count(events, LifecycleEventKind::Completed) != 1U) {
      spdlog::error("retrigger while running should not restart or double-complete");
      return 2;
    }
    if (!approx(before_reset.asteroid.deflection_offset_m.y, 2.0)) {
      spdlog::error("tow offset before reset mismatch: {}", before_reset.asteroid.deflection_offset_m.y);
      return 3;
    }
    if (at_reset.asteroid.deflection_offset_m != Vec3{} || count(at_reset.events, LifecycleEventKind::OffsetReset) != 1U) {
      spdlog::error("offset should be exactly zero once the cooldown elapses");
      return 4;
    }
    if (orch.is_running(Technique::GravityTractor) || orch.pending_actions() != 0U) {
      spdlog::error("held request flag must not restart a completed technique");
      return 5;
    }
  }

  // Kinetic impactor: blink path hides, resets and re-shows the asteroid.
  {
    EffectOrchestrator orch;
    orch.set_requested(EffectKey::KineticImpactor, true);
    for (int i = 0; i <= 100; ++i) {
      const auto r = orch.tick(i / 10.0);
      if (i == 40 && !approx(r.asteroid.deflection_offset_m.x, 3.0)) {
        spdlog::error("kinetic impulse should be visible before completion");
        return 6;
      }
      if (i == 50 && (r.asteroid.visible || r.asteroid.deflection_offset_m != Vec3{} ||
                      count(r.events, LifecycleEventKind::Completed) != 1U ||
                      count(r.events, LifecycleEventKind::AsteroidHidden) != 1U)) {
        spdlog::error("kinetic completion should hide the asteroid with a cleared offset");
        return 7;
      }
      if (i == 80 && (!r.asteroid.visible || count(r.events, LifecycleEventKind::AsteroidShown) != 1U)) {
        spdlog::error("asteroid should reappear after the blink delay");
        return 8;
      }
    }
  }

  // Disrupting nuclear yield: destroyed, never completed, asteroid hidden then shown.
  {
    EffectOrchestrator::Config config{};
    config.engines.nuclear_detonation.yield_mt = 2.0;
    EffectOrchestrator orch(config);
    std::vector<LifecycleEvent> events;
    orch.set_requested(EffectKey::NuclearDetonation, true);
    bool hidden_seen = false;
    for (int i = 0; i <= 120; ++i) {
      const auto r = orch.tick(i / 10.0);
      append(events, r);
      hidden_seen = hidden_seen || !r.asteroid.visible;
      if (r.asteroid.deflection_offset_m != Vec3{}) {
        spdlog::error("disrupting burst must not deflect");
        return 9;
      }
    }
    if (count(events, LifecycleEventKind::Destroyed) != 1U || count(events, LifecycleEventKind::Completed) != 0U ||
        !hidden_seen || !orch.asteroid().visible) {
      spdlog::error("destroy outcome mismatch");
      return 10;
    }
  }

  // Deflecting nuclear burst: offset held until the nuclear cooldown, then exactly zero.
  {
    EffectOrchestrator orch;
    orch.set_requested(EffectKey::NuclearDetonation, true);
    for (int i = 0; i <= 80; ++i) {
      const auto r = orch.tick(i / 10.0);
      if (i == 49 && r.asteroid.deflection_offset_m == Vec3{}) {
        spdlog::error("nuclear burst should deflect before completion");
        return 23;
      }
      if (i == 50 && (count(r.events, LifecycleEventKind::Completed) != 1U || !r.asteroid.visible ||
                      count(r.events, LifecycleEventKind::Destroyed) != 0U)) {
        spdlog::error("sub-threshold burst should complete without hiding");
        return 24;
      }
      if (i == 70) {
        bool nuclear_reset = false;
        for (const auto& e : r.events) {
          nuclear_reset = nuclear_reset ||
                          (e.kind == LifecycleEventKind::OffsetReset && e.effect == EffectKey::NuclearDetonation);
        }
        if (!nuclear_reset || r.asteroid.deflection_offset_m != Vec3{}) {
          spdlog::error("nuclear cooldown should reset the offset to exactly zero");
          return 25;
        }
      }
    }
  }

  // Laser completion shares the blink path.
  {
    EffectOrchestrator orch;
    orch.set_requested(EffectKey::LaserAblation, true);
    for (int i = 0; i <= 130; ++i) {
      const auto r = orch.tick(i / 10.0);
      if (i == 89 && r.asteroid.deflection_offset_m == Vec3{}) {
        spdlog::error("laser should have pushed before completion");
        return 26;
      }
      if (i == 90 && (count(r.events, LifecycleEventKind::Completed) != 1U || r.asteroid.visible ||
                      r.asteroid.deflection_offset_m != Vec3{})) {
        spdlog::error("laser completion should hide the asteroid with a cleared offset");
        return 27;
      }
      if (i == 120 && (!r.asteroid.visible || count(r.events, LifecycleEventKind::AsteroidShown) != 1U ||
                       r.asteroid.deflection_offset_m != Vec3{})) {
        spdlog::error("asteroid should reappear after the laser blink delay");
        return 28;
      }
    }
  }

  // External hide cancels running engines; armed requests wait for visibility.
  {
    EffectOrchestrator orch;
    orch.set_requested(EffectKey::IonBeamShepherd, true);
    for (int i = 0; i <= 60; ++i) {
      (void)orch.tick(i / 10.0);
    }
    if (orch.asteroid().deflection_offset_m == Vec3{}) {
      spdlog::error("ion beam should have pushed by t=6");
      return 11;
    }
    orch.set_asteroid_visible(false);
    if (orch.is_running(Technique::IonBeamShepherd)) {
      spdlog::error("hiding should cancel immediately");
      return 12;
    }
    orch.set_requested(EffectKey::GravityTractor, true);
    const auto hidden = orch.tick(7.0);
    if (count(hidden.events, LifecycleEventKind::Cancelled) != 1U ||
        count(hidden.events, LifecycleEventKind::Completed) != 0U || orch.is_running(Technique::GravityTractor)) {
      spdlog::error("cancel should not complete, and nothing starts while hidden");
      return 13;
    }
    orch.set_asteroid_visible(true);
    const auto shown = orch.tick(7.1);
    if (count(shown.events, LifecycleEventKind::AsteroidShown) != 1U || !orch.is_running(Technique::GravityTractor) ||
        orch.is_running(Technique::IonBeamShepherd)) {
      spdlog::error("armed request should start once visible");
      return 14;
    }
    if (shown.asteroid.deflection_offset_m != Vec3{}) {
      spdlog::error("re-show should clear the offset");
      return 15;
    }
  }

  // Invalid engine config is rejected at start.
  {
    EffectOrchestrator::Config config{};
    config.engines.gravity_tractor.approach_duration_s = 0.0;
    EffectOrchestrator orch(config);
    orch.set_requested(EffectKey::GravityTractor, true);
    const auto r = orch.tick(0.0);
    if (count(r.events, LifecycleEventKind::RejectedConfig) != 1U || orch.is_running(Technique::GravityTractor) ||
        r.engines[static_cast<std::size_t>(Technique::GravityTractor)].has_value()) {
      spdlog::error("invalid engine config should be rejected");
      return 16;
    }
  }

  // Invalid orchestrator config never runs anything.
  {
    EffectOrchestrator::Config config{};
    config.blink_delay_s = -1.0;
    EffectOrchestrator orch(config);
    orch.set_requested(EffectKey::LaserAblation, true);
    const auto r = orch.tick(0.0);
    if (orch.config_status() != deflectsim::core::Status::InvalidInput || orch.is_running(Technique::LaserAblation)) {
      spdlog::error("invalid orchestrator config should be inert");
      return 17;
    }
    for (const auto& e : r.engines) {
      if (e.has_value()) {
        spdlog::error("inert orchestrator produced engine output");
        return 18;
      }
    }
  }

  // Analysis scan is independent of deflection state.
  {
    EffectOrchestrator orch;
    std::vector<LifecycleEvent> events;
    orch.set_requested(EffectKey::Analyze, true);
    for (int i = 0; i <= 40; ++i) {
      const auto r = orch.tick(i / 10.0);
      append(events, r);
      if (i == 30 && !r.scan.reveal_report) {
        spdlog::error("report should be revealed after 3 s");
        return 19;
      }
    }
    orch.close_report();
    append(events, orch.tick(4.1));
    if (count(events, LifecycleEventKind::ScanStarted) != 1U || count(events, LifecycleEventKind::ReportRevealed) != 1U ||
        count(events, LifecycleEventKind::ScanClosed) != 1U || orch.asteroid().deflection_offset_m != Vec3{}) {
      spdlog::error("analysis lifecycle mismatch");
      return 20;
    }
    orch.set_requested(EffectKey::Analyze, true);
    const auto again = orch.tick(5.0);
    if (count(again.events, LifecycleEventKind::ScanStarted) != 1U) {
      spdlog::error("closing the report should allow a new scan request");
      return 22;
    }
  }

  if (deflectsim::scene::parse_effect_key("analyze") != EffectKey::Analyze ||
      deflectsim::scene::parse_effect_key("ionBeamShepherd") != EffectKey::IonBeamShepherd ||
      deflectsim::scene::parse_effect_key("warpDrive").has_value() ||
      deflectsim::scene::to_technique(EffectKey::Analyze).has_value()) {
    spdlog::error("effect key mapping mismatch");
    return 21;
  }

  return 0;
}
