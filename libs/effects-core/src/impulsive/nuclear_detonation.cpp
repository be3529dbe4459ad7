/**
 * @file nuclear_detonation.cpp
 * @brief Standoff nuclear detonation phase engine implementation.
 * @author Watosn
 */

#include "deflectsim/effects/impulsive/nuclear_detonation.hpp"

#include <cmath>

namespace deflectsim::effects {
namespace {

deflectsim::core::Status validate(const NuclearDetonationEngine::Config& c) {
  if (!(c.approach_duration_s > 0.0) || !(c.detonation_duration_s > 0.0) || !(c.yield_mt >= 0.0) ||
      !(c.disruption_threshold_mt > 0.0) || !(c.deflection_magnitude >= 0.0) || !(c.fireball_peak_scale >= 0.0)) {
    return deflectsim::core::Status::InvalidInput;
  }
  return deflectsim::core::Status::Ok;
}

}  // namespace

NuclearDetonationEngine::NuclearDetonationEngine(const Config& config) : config_(config), config_status_(validate(config)) {}

void NuclearDetonationEngine::reset_progress() {
  detonation_.reset();
  terminal_.reset();
  target_position_ = deflectsim::core::Vec3{};
  launch_position_ = deflectsim::core::Vec3{};
}

EngineOutput NuclearDetonationEngine::tick(const EngineInput& input) {
  const auto elapsed = clock_.update(input.is_active, input.now_s);
  if (!elapsed.has_value()) {
    reset_progress();
    return idle_output(technique(), config_status_);
  }
  if (config_status_ != deflectsim::core::Status::Ok) {
    return idle_output(technique(), config_status_);
  }
  if (clock_.just_activated()) {
    reset_progress();
    target_position_ = input.asteroid_world_position;
    launch_position_ = launch_position_toward(target_position_);
  }

  const double t = *elapsed;
  const double detonate_at = config_.approach_duration_s;
  const double end_at = detonate_at + config_.detonation_duration_s;
  const auto burst_point = target_position_ + config_.standoff_offset;

  EngineOutput out{};
  out.technique = technique();

  if (t < detonate_at) {
    out.phase = Phase::Approach;
    out.visual.spacecraft_visible = true;
    out.visual.spacecraft_position = interpolate(launch_position_, burst_point, t / detonate_at);
  } else if (t < end_at) {
    out.phase = Phase::Detonation;
    out.visual.flash_visible = true;
    // Fireball grows quickly, then holds.
    const double f = (t - detonate_at) / config_.detonation_duration_s;
    out.visual.flash_scale = config_.fireball_peak_scale * std::sqrt(f);
  } else {
    out.phase = disrupts() ? Phase::Destroyed : Phase::Complete;
  }

  if (t >= detonate_at && detonation_.fire() && !disrupts()) {
    deflectsim::core::Status dir_status = deflectsim::core::Status::Ok;
    const auto dir = unit_direction(input.asteroid_world_position - burst_point, &dir_status);
    if (dir_status == deflectsim::core::Status::Ok) {
      out.deflection_delta = config_.deflection_magnitude * dir;
    } else {
      out.status = dir_status;
    }
  }

  if (t >= end_at && terminal_.fire()) {
    if (disrupts()) {
      out.destroyed = true;
    } else {
      out.completed = true;
    }
  }
  return out;
}

}  // namespace deflectsim::effects
