/**
 * @file phase_engine.cpp
 * @brief Shared phase-engine helpers.
 * @author Watosn
 */

#include "deflectsim/effects/core/phase_engine.hpp"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

#include "deflectsim/core/constants.hpp"

namespace deflectsim::effects {

std::optional<double> ActivationClock::update(bool is_active, double now_s) {
  if (!is_active) {
    start_time_s_.reset();
    just_activated_ = false;
    return std::nullopt;
  }
  if (!start_time_s_.has_value()) {
    start_time_s_ = now_s;
    just_activated_ = true;
    return 0.0;
  }
  just_activated_ = false;
  return now_s - *start_time_s_;
}

std::string_view technique_name(Technique technique) {
  switch (technique) {
    case Technique::KineticImpactor:
      return "kineticImpactor";
    case Technique::NuclearDetonation:
      return "nuclearDetonation";
    case Technique::GravityTractor:
      return "gravityTractor";
    case Technique::LaserAblation:
      return "laserAblation";
    case Technique::IonBeamShepherd:
      return "ionBeamShepherd";
  }
  return "unknown";
}

std::string_view phase_name(Phase phase) {
  switch (phase) {
    case Phase::Idle:
      return "idle";
    case Phase::Approach:
      return "approach";
    case Phase::Impact:
      return "impact";
    case Phase::Cooldown:
      return "cooldown";
    case Phase::Detonation:
      return "detonation";
    case Phase::Targeting:
      return "targeting";
    case Phase::StationKeeping:
      return "station_keeping";
    case Phase::Beam:
      return "beam";
    case Phase::Complete:
      return "complete";
    case Phase::Destroyed:
      return "destroyed";
  }
  return "unknown";
}

std::optional<Technique> parse_technique(std::string_view key) {
  for (std::size_t i = 0; i < kTechniqueCount; ++i) {
    const auto t = static_cast<Technique>(i);
    if (technique_name(t) == key) {
      return t;
    }
  }
  return std::nullopt;
}

deflectsim::core::Vec3 unit_direction(const deflectsim::core::Vec3& v, deflectsim::core::Status* status_out) {
  const double n = deflectsim::core::norm(v);
  if (!(n > 0.0) || !std::isfinite(n)) {
    if (status_out) {
      *status_out = deflectsim::core::Status::InvalidInput;
    }
    return deflectsim::core::Vec3{};
  }
  if (status_out) {
    *status_out = deflectsim::core::Status::Ok;
  }
  return v / n;
}

deflectsim::core::Vec3 launch_position_toward(const deflectsim::core::Vec3& target) {
  const auto& earth = deflectsim::core::constants::kEarthPosition;
  const Eigen::Vector3d to_target(target.x - earth.x, target.y - earth.y, target.z - earth.z);
  if (!(to_target.norm() > 0.0)) {
    return earth;
  }
  const Eigen::Vector3d launch =
      Eigen::Vector3d(earth.x, earth.y, earth.z) + deflectsim::core::constants::kLaunchShellRadius * to_target.normalized();
  return deflectsim::core::Vec3{launch.x(), launch.y(), launch.z()};
}

deflectsim::core::Vec3 interpolate(const deflectsim::core::Vec3& from, const deflectsim::core::Vec3& to, double fraction) {
  const double f = std::clamp(fraction, 0.0, 1.0);
  const Eigen::Vector3d a(from.x, from.y, from.z);
  const Eigen::Vector3d b(to.x, to.y, to.z);
  const Eigen::Vector3d p = a + f * (b - a);
  return deflectsim::core::Vec3{p.x(), p.y(), p.z()};
}

}  // namespace deflectsim::effects
