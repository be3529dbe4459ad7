/**
 * @file kinetic_impactor.hpp
 * @brief Kinetic impactor phase engine.
 * @author Watosn
 */
#pragma once

#include "deflectsim/effects/core/phase_engine.hpp"

namespace deflectsim::effects {

/**
 * @brief Spacecraft flies from the launch shell into the asteroid and applies one impulse.
 *
 * Phases: Approach -> Impact -> Cooldown -> Complete. The single deflection delta is
 * emitted on the first tick at or past the impact instant, along the launch->asteroid line.
 */
class KineticImpactorEngine final : public IPhaseEngine {
 public:
  /**
   * @brief Configuration for kinetic impactor timing and impulse.
   */
  struct Config {
    double approach_duration_s{3.0};
    double impact_duration_s{1.0};
    double cooldown_duration_s{1.0};
    double deflection_magnitude{3.0};
    double flash_peak_scale{4.0};
  };

  KineticImpactorEngine() : KineticImpactorEngine(Config{}) {}
  explicit KineticImpactorEngine(const Config& config);

  [[nodiscard]] EngineOutput tick(const EngineInput& input) override;
  [[nodiscard]] Technique technique() const override { return Technique::KineticImpactor; }
  [[nodiscard]] deflectsim::core::Status config_status() const override { return config_status_; }

 private:
  void reset_progress();

  Config config_{};
  deflectsim::core::Status config_status_{deflectsim::core::Status::Ok};
  ActivationClock clock_{};
  OneShot impact_{};
  OneShot complete_{};
  deflectsim::core::Vec3 launch_position_{};
};

}  // namespace deflectsim::effects
