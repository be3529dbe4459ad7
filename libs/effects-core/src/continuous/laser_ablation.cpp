/**
 * @file laser_ablation.cpp
 * @brief Laser ablation phase engine implementation.
 * @author Watosn
 */

#include "deflectsim/effects/continuous/laser_ablation.hpp"

#include <algorithm>

namespace deflectsim::effects {
namespace {

constexpr double kBeamRampS = 0.5;

deflectsim::core::Status validate(const LaserAblationEngine::Config& c) {
  if (!(c.targeting_duration_s > 0.0) || !(c.beam_duration_s > 0.0) || !(c.ablation_constant >= 0.0) ||
      !(c.min_emission_interval_s > 0.0)) {
    return deflectsim::core::Status::InvalidInput;
  }
  return deflectsim::core::Status::Ok;
}

}  // namespace

LaserAblationEngine::LaserAblationEngine(const Config& config)
    : config_(config), config_status_(validate(config)), emission_(config.min_emission_interval_s) {}

void LaserAblationEngine::reset_progress() {
  emission_.reset();
  complete_.reset();
  source_position_ = deflectsim::core::Vec3{};
}

EngineOutput LaserAblationEngine::tick(const EngineInput& input) {
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
    source_position_ = launch_position_toward(input.asteroid_world_position);
  }

  const double t = *elapsed;

  EngineOutput out{};
  out.technique = technique();
  out.visual.spacecraft_visible = true;
  out.visual.spacecraft_position = source_position_;

  if (t < config_.targeting_duration_s) {
    out.phase = Phase::Targeting;
    return out;
  }
  if (t >= total_duration_s()) {
    out.phase = Phase::Complete;
    out.visual.spacecraft_visible = false;
    out.completed = complete_.fire();
    return out;
  }

  out.phase = Phase::Beam;
  out.visual.beam_visible = true;
  out.visual.beam_intensity = std::clamp((t - config_.targeting_duration_s) / kBeamRampS, 0.0, 1.0);
  if (emission_.ready(t)) {
    const auto push = unit_direction(input.asteroid_world_position - source_position_, &out.status);
    if (out.status == deflectsim::core::Status::Ok) {
      out.deflection_delta = config_.ablation_constant * push;
    }
  }
  return out;
}

}  // namespace deflectsim::effects
