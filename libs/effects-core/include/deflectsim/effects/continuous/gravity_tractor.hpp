/**
 * @file gravity_tractor.hpp
 * @brief Gravity tractor phase engine.
 * @author Watosn
 */
#pragma once

#include "deflectsim/effects/core/phase_engine.hpp"

namespace deflectsim::effects {

/**
 * @brief Spacecraft hovers beside the asteroid and tows it with its own gravity.
 *
 * Phases: Approach -> StationKeeping -> Complete. During station keeping a delta of
 * `force_constant` toward the spacecraft is emitted at most once per emission interval.
 */
class GravityTractorEngine final : public IPhaseEngine {
 public:
  /**
   * @brief Configuration for tractor timing and towing force.
   */
  struct Config {
    double approach_duration_s{3.0};
    double station_keeping_duration_s{10.0};
    double force_constant{0.02};
    deflectsim::core::Vec3 hover_offset{0.0, 4.0, 0.0};
    double min_emission_interval_s{0.05};
  };

  GravityTractorEngine() : GravityTractorEngine(Config{}) {}
  explicit GravityTractorEngine(const Config& config);

  [[nodiscard]] EngineOutput tick(const EngineInput& input) override;
  [[nodiscard]] Technique technique() const override { return Technique::GravityTractor; }
  [[nodiscard]] deflectsim::core::Status config_status() const override { return config_status_; }

  /**
   * @brief Total activation length (approach + station keeping).
   */
  [[nodiscard]] double total_duration_s() const { return config_.approach_duration_s + config_.station_keeping_duration_s; }

 private:
  void reset_progress();

  Config config_{};
  deflectsim::core::Status config_status_{deflectsim::core::Status::Ok};
  ActivationClock clock_{};
  EmissionGate emission_;
  OneShot complete_{};
  deflectsim::core::Vec3 launch_position_{};
};

}  // namespace deflectsim::effects
