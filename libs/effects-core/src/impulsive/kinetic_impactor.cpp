/**
 * @file kinetic_impactor.cpp
 * @brief Kinetic impactor phase engine implementation.
 * @author Watosn
 */

#include "deflectsim/effects/impulsive/kinetic_impactor.hpp"

namespace deflectsim::effects {
namespace {

deflectsim::core::Status validate(const KineticImpactorEngine::Config& c) {
  if (!(c.approach_duration_s > 0.0) || !(c.impact_duration_s > 0.0) || !(c.cooldown_duration_s >= 0.0) ||
      !(c.deflection_magnitude >= 0.0) || !(c.flash_peak_scale >= 0.0)) {
    return deflectsim::core::Status::InvalidInput;
  }
  return deflectsim::core::Status::Ok;
}

}  // namespace

KineticImpactorEngine::KineticImpactorEngine(const Config& config) : config_(config), config_status_(validate(config)) {}

void KineticImpactorEngine::reset_progress() {
  impact_.reset();
  complete_.reset();
  launch_position_ = deflectsim::core::Vec3{};
}

EngineOutput KineticImpactorEngine::tick(const EngineInput& input) {
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
    launch_position_ = launch_position_toward(input.asteroid_world_position);
  }

  const double t = *elapsed;
  const double impact_at = config_.approach_duration_s;
  const double cooldown_at = impact_at + config_.impact_duration_s;
  const double complete_at = cooldown_at + config_.cooldown_duration_s;

  EngineOutput out{};
  out.technique = technique();

  if (t < impact_at) {
    out.phase = Phase::Approach;
    out.visual.spacecraft_visible = true;
    out.visual.spacecraft_position = interpolate(launch_position_, input.asteroid_world_position, t / impact_at);
  } else if (t < cooldown_at) {
    out.phase = Phase::Impact;
    out.visual.flash_visible = true;
    out.visual.flash_scale = config_.flash_peak_scale * (t - impact_at) / config_.impact_duration_s;
  } else if (t < complete_at) {
    out.phase = Phase::Cooldown;
  } else {
    out.phase = Phase::Complete;
  }

  if (t >= impact_at && impact_.fire()) {
    deflectsim::core::Status dir_status = deflectsim::core::Status::Ok;
    const auto dir = unit_direction(input.asteroid_world_position - launch_position_, &dir_status);
    if (dir_status == deflectsim::core::Status::Ok) {
      out.deflection_delta = config_.deflection_magnitude * dir;
    } else {
      out.status = dir_status;
    }
  }

  if (out.phase == Phase::Complete && complete_.fire()) {
    out.completed = true;
  }
  return out;
}

}  // namespace deflectsim::effects
