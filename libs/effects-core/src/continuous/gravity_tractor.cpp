/**
 * @file gravity_tractor.cpp
 * @brief Gravity tractor phase engine implementation.
 * @author Watosn
 */

#include "deflectsim/effects/continuous/gravity_tractor.hpp"

namespace deflectsim::effects {
namespace {

deflectsim::core::Status validate(const GravityTractorEngine::Config& c) {
  if (!(c.approach_duration_s > 0.0) || !(c.station_keeping_duration_s > 0.0) || !(c.force_constant >= 0.0) ||
      !(c.min_emission_interval_s > 0.0) || !(deflectsim::core::norm(c.hover_offset) > 0.0)) {
    return deflectsim::core::Status::InvalidInput;
  }
  return deflectsim::core::Status::Ok;
}

}  // namespace

GravityTractorEngine::GravityTractorEngine(const Config& config)
    : config_(config), config_status_(validate(config)), emission_(config.min_emission_interval_s) {}

void GravityTractorEngine::reset_progress() {
  emission_.reset();
  complete_.reset();
  launch_position_ = deflectsim::core::Vec3{};
}

EngineOutput GravityTractorEngine::tick(const EngineInput& input) {
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
  const auto station = input.asteroid_world_position + config_.hover_offset;

  EngineOutput out{};
  out.technique = technique();

  if (t < config_.approach_duration_s) {
    out.phase = Phase::Approach;
    out.visual.spacecraft_visible = true;
    out.visual.spacecraft_position = interpolate(launch_position_, station, t / config_.approach_duration_s);
    return out;
  }

  if (t >= total_duration_s()) {
    out.phase = Phase::Complete;
    out.completed = complete_.fire();
    return out;
  }

  out.phase = Phase::StationKeeping;
  out.visual.spacecraft_visible = true;
  out.visual.spacecraft_position = station;
  if (emission_.ready(t)) {
    const auto pull = unit_direction(config_.hover_offset, &out.status);
    if (out.status == deflectsim::core::Status::Ok) {
      out.deflection_delta = config_.force_constant * pull;
    }
  }
  return out;
}

}  // namespace deflectsim::effects
