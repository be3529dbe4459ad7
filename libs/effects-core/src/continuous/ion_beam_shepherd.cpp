/**
 * @file ion_beam_shepherd.cpp
 * @brief Ion beam shepherd phase engine implementation.
 * @author Watosn
 */

#include "deflectsim/effects/continuous/ion_beam_shepherd.hpp"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

namespace deflectsim::effects {
namespace {

deflectsim::core::Status validate(const IonBeamShepherdEngine::Config& c) {
  if (!(c.approach_duration_s > 0.0) || !(c.shepherd_duration_s > 0.0) || !(c.base_force >= 0.0) ||
      !(c.force_ramp >= 0.0) || !(c.min_emission_interval_s > 0.0) ||
      !(deflectsim::core::norm(c.station_offset) > 0.0)) {
    return deflectsim::core::Status::InvalidInput;
  }
  return deflectsim::core::Status::Ok;
}

}  // namespace

IonBeamShepherdEngine::IonBeamShepherdEngine(const Config& config)
    : config_(config), config_status_(validate(config)), emission_(config.min_emission_interval_s) {}

void IonBeamShepherdEngine::reset_progress() {
  emission_.reset();
  complete_.reset();
  launch_position_ = deflectsim::core::Vec3{};
}

double IonBeamShepherdEngine::force_at(double progress) const {
  return config_.base_force * (1.0 + config_.force_ramp * std::clamp(progress, 0.0, 1.0));
}

EngineOutput IonBeamShepherdEngine::tick(const EngineInput& input) {
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
  const auto station = input.asteroid_world_position + config_.station_offset;

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

  const double progress = std::min((t - config_.approach_duration_s) / config_.shepherd_duration_s, 1.0);

  out.phase = Phase::Beam;
  out.visual.spacecraft_visible = true;
  out.visual.spacecraft_position = station;
  out.visual.beam_visible = true;
  out.visual.beam_intensity = config_.beam_base_intensity + progress * config_.beam_intensity_ramp;

  if (emission_.ready(t)) {
    const Eigen::Vector3d craft(station.x, station.y, station.z);
    const Eigen::Vector3d target(input.asteroid_world_position.x, input.asteroid_world_position.y,
                                 input.asteroid_world_position.z);
    const Eigen::Vector3d beam_axis = target - craft;
    if (!(beam_axis.norm() > 0.0) || !std::isfinite(beam_axis.norm())) {
      out.status = deflectsim::core::Status::InvalidInput;
      return out;
    }
    const Eigen::Vector3d push = force_at(progress) * beam_axis.normalized();
    out.deflection_delta = deflectsim::core::Vec3{push.x(), push.y(), push.z()};
  }
  return out;
}

}  // namespace deflectsim::effects
