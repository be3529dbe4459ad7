/**
 * @file effect_orchestrator.cpp
 * @brief Effect orchestration implementation.
 * @author Watosn
 */

#include "deflectsim/scene/effect_orchestrator.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace deflectsim::scene {
namespace {

using deflectsim::effects::Technique;

deflectsim::core::Status validate(const EffectOrchestrator::Config& c) {
  if (!(c.beam_reset_delay_s >= 0.0) || !(c.nuclear_reset_delay_s >= 0.0) || !(c.blink_delay_s >= 0.0) ||
      !(c.destroy_hidden_s >= 0.0)) {
    return deflectsim::core::Status::InvalidInput;
  }
  return deflectsim::core::Status::Ok;
}

std::size_t slot_index(Technique technique) { return static_cast<std::size_t>(technique); }

}  // namespace

std::string_view effect_key_name(EffectKey key) {
  if (key == EffectKey::Analyze) {
    return "analyze";
  }
  return deflectsim::effects::technique_name(*to_technique(key));
}

std::optional<EffectKey> parse_effect_key(std::string_view name) {
  if (name == "analyze") {
    return EffectKey::Analyze;
  }
  const auto technique = deflectsim::effects::parse_technique(name);
  if (!technique.has_value()) {
    return std::nullopt;
  }
  return to_effect_key(*technique);
}

std::optional<Technique> to_technique(EffectKey key) {
  if (key == EffectKey::Analyze) {
    return std::nullopt;
  }
  return static_cast<Technique>(static_cast<std::uint8_t>(key));
}

EffectKey to_effect_key(Technique technique) { return static_cast<EffectKey>(static_cast<std::uint8_t>(technique)); }

std::string_view lifecycle_event_name(LifecycleEventKind kind) {
  switch (kind) {
    case LifecycleEventKind::Started:
      return "started";
    case LifecycleEventKind::IgnoredRetrigger:
      return "ignored_retrigger";
    case LifecycleEventKind::Completed:
      return "completed";
    case LifecycleEventKind::Destroyed:
      return "destroyed";
    case LifecycleEventKind::Cancelled:
      return "cancelled";
    case LifecycleEventKind::RejectedConfig:
      return "rejected_config";
    case LifecycleEventKind::OffsetReset:
      return "offset_reset";
    case LifecycleEventKind::AsteroidHidden:
      return "asteroid_hidden";
    case LifecycleEventKind::AsteroidShown:
      return "asteroid_shown";
    case LifecycleEventKind::ScanStarted:
      return "scan_started";
    case LifecycleEventKind::ReportRevealed:
      return "report_revealed";
    case LifecycleEventKind::ScanClosed:
      return "scan_closed";
  }
  return "unknown";
}

EffectOrchestrator::EffectOrchestrator(Config config)
    : config_(std::move(config)),
      config_status_(validate(config_)),
      accumulator_(config_.asteroid_base_position),
      scan_(config_.scan) {
  if (config_status_ != deflectsim::core::Status::Ok) {
    spdlog::error("orchestrator config rejected: cooldown windows must be non-negative");
  }
}

void EffectOrchestrator::emit(LifecycleEventKind kind, std::optional<EffectKey> effect, double time_s) {
  events_.push_back(LifecycleEvent{.kind = kind, .effect = effect, .time_s = time_s});
}

void EffectOrchestrator::set_requested(EffectKey key, bool requested) {
  if (key == EffectKey::Analyze) {
    const bool rising = requested && !analysis_requested_;
    analysis_requested_ = requested;
    if (!requested) {
      analysis_armed_ = false;
    } else if (rising) {
      if (scan_.state() == ScanState::Idle) {
        analysis_armed_ = true;
      } else {
        spdlog::debug("analysis already {}; request ignored",
                      scan_.state() == ScanState::Scanning ? "scanning" : "showing report");
        emit(LifecycleEventKind::IgnoredRetrigger, key, last_tick_s_);
      }
    }
    return;
  }

  auto& slot = slots_[slot_index(*to_technique(key))];
  const bool rising = requested && !slot.requested;
  slot.requested = requested;
  if (!requested) {
    slot.armed = false;
    return;
  }
  if (!rising) {
    return;
  }
  if (slot.engine) {
    spdlog::debug("{} already running; re-trigger ignored", effect_key_name(key));
    emit(LifecycleEventKind::IgnoredRetrigger, key, last_tick_s_);
    return;
  }
  slot.armed = true;
}

bool EffectOrchestrator::requested(EffectKey key) const {
  if (key == EffectKey::Analyze) {
    return analysis_requested_;
  }
  return slots_[slot_index(*to_technique(key))].requested;
}

void EffectOrchestrator::set_asteroid_visible(bool visible) {
  if (visible == visible_) {
    return;
  }
  visible_ = visible;
  if (!visible) {
    cancel_running(last_tick_s_);
    emit(LifecycleEventKind::AsteroidHidden, std::nullopt, last_tick_s_);
    spdlog::info("asteroid hidden at t={:.3f}", last_tick_s_);
    return;
  }
  accumulator_.reset();
  emit(LifecycleEventKind::AsteroidShown, std::nullopt, last_tick_s_);
  spdlog::info("asteroid shown at t={:.3f}; offset cleared", last_tick_s_);
}

void EffectOrchestrator::close_report() {
  if (scan_.state() == ScanState::Idle) {
    return;
  }
  scan_.close();
  analysis_requested_ = false;
  analysis_armed_ = false;
  emit(LifecycleEventKind::ScanClosed, EffectKey::Analyze, last_tick_s_);
}

bool EffectOrchestrator::is_running(Technique technique) const { return slots_[slot_index(technique)].engine != nullptr; }

deflectsim::core::AsteroidState EffectOrchestrator::asteroid() const {
  return deflectsim::core::AsteroidState{
      .base_position_m = accumulator_.base_position(),
      .deflection_offset_m = accumulator_.current_offset(),
      .world_position_m = accumulator_.world_position(),
      .visible = visible_,
  };
}

void EffectOrchestrator::cancel_running(double now_s) {
  for (std::size_t i = 0; i < slots_.size(); ++i) {
    auto& slot = slots_[i];
    if (!slot.engine) {
      continue;
    }
    const auto technique = static_cast<Technique>(i);
    slot.engine.reset();
    emit(LifecycleEventKind::Cancelled, to_effect_key(technique), now_s);
    spdlog::info("{} cancelled at t={:.3f}", deflectsim::effects::technique_name(technique), now_s);
  }
}

void EffectOrchestrator::run_due_actions(double now_s) {
  for (const auto& action : timers_.pop_due(now_s)) {
    accumulator_.reset();
    const auto source = to_effect_key(action.source);
    switch (action.kind) {
      case ScheduledActionKind::ResetOffset:
        emit(LifecycleEventKind::OffsetReset, source, now_s);
        spdlog::info("offset reset after {} cooldown at t={:.3f}", effect_key_name(source), now_s);
        break;
      case ScheduledActionKind::ShowAsteroid:
        visible_ = true;
        emit(LifecycleEventKind::OffsetReset, source, now_s);
        emit(LifecycleEventKind::AsteroidShown, source, now_s);
        spdlog::info("asteroid shown after {} at t={:.3f}", effect_key_name(source), now_s);
        break;
    }
  }
}

void EffectOrchestrator::start_armed(double now_s) {
  if (visible_) {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
      auto& slot = slots_[i];
      if (!slot.armed || slot.engine) {
        continue;
      }
      slot.armed = false;
      const auto technique = static_cast<Technique>(i);
      auto engine = deflectsim::effects::make_engine(technique, config_.engines);
      if (!engine || engine->config_status() != deflectsim::core::Status::Ok) {
        spdlog::error("{} rejected: invalid engine config", deflectsim::effects::technique_name(technique));
        emit(LifecycleEventKind::RejectedConfig, to_effect_key(technique), now_s);
        continue;
      }
      slot.engine = std::move(engine);
      emit(LifecycleEventKind::Started, to_effect_key(technique), now_s);
      spdlog::info("{} started at t={:.3f}", deflectsim::effects::technique_name(technique), now_s);
    }
  }

  if (analysis_armed_ && scan_.state() == ScanState::Idle) {
    analysis_armed_ = false;
    if (scan_.activate(now_s)) {
      emit(LifecycleEventKind::ScanStarted, EffectKey::Analyze, now_s);
      spdlog::info("analysis scan started at t={:.3f}", now_s);
    } else {
      spdlog::error("analysis scan rejected: invalid scan config");
      emit(LifecycleEventKind::RejectedConfig, EffectKey::Analyze, now_s);
    }
  }
}

void EffectOrchestrator::hide_until(double show_at_s, Technique source, double now_s) {
  visible_ = false;
  accumulator_.reset();
  emit(LifecycleEventKind::AsteroidHidden, to_effect_key(source), now_s);
  timers_.schedule(ScheduledAction{.due_s = show_at_s, .kind = ScheduledActionKind::ShowAsteroid, .source = source});
}

void EffectOrchestrator::handle_completed(Technique technique, double now_s) {
  slots_[slot_index(technique)].engine.reset();
  emit(LifecycleEventKind::Completed, to_effect_key(technique), now_s);
  spdlog::info("{} completed at t={:.3f}", deflectsim::effects::technique_name(technique), now_s);

  switch (technique) {
    case Technique::KineticImpactor:
    case Technique::LaserAblation:
      // Shared "deflection achieved" beat: blink the asteroid out and back with a clean offset.
      hide_until(now_s + config_.blink_delay_s, technique, now_s);
      break;
    case Technique::NuclearDetonation:
      timers_.schedule(ScheduledAction{
          .due_s = now_s + config_.nuclear_reset_delay_s, .kind = ScheduledActionKind::ResetOffset, .source = technique});
      break;
    case Technique::GravityTractor:
    case Technique::IonBeamShepherd:
      timers_.schedule(ScheduledAction{
          .due_s = now_s + config_.beam_reset_delay_s, .kind = ScheduledActionKind::ResetOffset, .source = technique});
      break;
  }
}

void EffectOrchestrator::handle_destroyed(Technique technique, double now_s) {
  slots_[slot_index(technique)].engine.reset();
  emit(LifecycleEventKind::Destroyed, to_effect_key(technique), now_s);
  spdlog::info("{} destroyed the asteroid at t={:.3f}", deflectsim::effects::technique_name(technique), now_s);
  hide_until(now_s + config_.destroy_hidden_s, technique, now_s);
}

TickReport EffectOrchestrator::tick(double now_s) {
  last_tick_s_ = now_s;
  TickReport report{};
  report.now_s = now_s;

  if (config_status_ != deflectsim::core::Status::Ok) {
    report.asteroid = asteroid();
    report.events = std::exchange(events_, {});
    return report;
  }

  run_due_actions(now_s);
  if (!visible_) {
    cancel_running(now_s);
  }
  start_armed(now_s);

  // Every engine sees the same pre-tick position so that delta order cannot matter.
  const auto world_position = accumulator_.world_position();
  for (std::size_t i = 0; i < slots_.size(); ++i) {
    auto& slot = slots_[i];
    if (!slot.engine) {
      continue;
    }
    report.engines[i] = slot.engine->tick(deflectsim::effects::EngineInput{
        .asteroid_world_position = world_position, .is_active = visible_, .now_s = now_s});
  }

  for (const auto& out : report.engines) {
    if (out.has_value() && out->deflection_delta.has_value()) {
      accumulator_.apply_delta(*out->deflection_delta);
      spdlog::debug("{} delta ({:.4f}, {:.4f}, {:.4f}) in {}", deflectsim::effects::technique_name(out->technique),
                    out->deflection_delta->x, out->deflection_delta->y, out->deflection_delta->z,
                    deflectsim::effects::phase_name(out->phase));
    }
  }

  for (const auto& out : report.engines) {
    if (!out.has_value()) {
      continue;
    }
    if (out->destroyed) {
      handle_destroyed(out->technique, now_s);
    } else if (out->completed) {
      handle_completed(out->technique, now_s);
    }
  }

  report.scan = scan_.tick(now_s);
  if (report.scan.reveal_report) {
    emit(LifecycleEventKind::ReportRevealed, EffectKey::Analyze, now_s);
    spdlog::info("analysis complete at t={:.3f}; report revealed", now_s);
  }

  report.asteroid = asteroid();
  report.events = std::exchange(events_, {});
  return report;
}

}  // namespace deflectsim::scene
