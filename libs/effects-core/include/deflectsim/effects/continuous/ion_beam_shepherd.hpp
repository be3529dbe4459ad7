/**
 * @file ion_beam_shepherd.hpp
 * @brief Ion beam shepherd phase engine.
 * @author Watosn
 */
#pragma once

#include "deflectsim/effects/core/phase_engine.hpp"

namespace deflectsim::effects {

/**
 * @brief Spacecraft parks at a fixed offset and pushes the asteroid with its ion exhaust.
 *
 * Phases: Approach -> Beam -> Complete. The approach interpolates the spacecraft from the
 * launch shell to `asteroid + station_offset` without deflecting. During the beam phase a
 * delta of `base_force * (1 + force_ramp * progress)` along spacecraft->asteroid is emitted
 * at most once per emission interval. Completion fires after approach + shepherd duration.
 */
class IonBeamShepherdEngine final : public IPhaseEngine {
 public:
  /**
   * @brief Configuration for approach/shepherd timing and beam thrust.
   */
  struct Config {
    double approach_duration_s{4.0};
    double shepherd_duration_s{12.0};
    double base_force{0.08};
    double force_ramp{0.5};
    deflectsim::core::Vec3 station_offset{-8.0, 3.0, 2.0};
    double min_emission_interval_s{0.05};
    double beam_base_intensity{0.8};
    double beam_intensity_ramp{0.4};
  };

  IonBeamShepherdEngine() : IonBeamShepherdEngine(Config{}) {}
  explicit IonBeamShepherdEngine(const Config& config);

  [[nodiscard]] EngineOutput tick(const EngineInput& input) override;
  [[nodiscard]] Technique technique() const override { return Technique::IonBeamShepherd; }
  [[nodiscard]] deflectsim::core::Status config_status() const override { return config_status_; }

  [[nodiscard]] double total_duration_s() const { return config_.approach_duration_s + config_.shepherd_duration_s; }

  /**
   * @brief Push magnitude at a given shepherd-phase progress in [0, 1].
   */
  [[nodiscard]] double force_at(double progress) const;

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
