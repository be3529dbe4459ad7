/**
 * @file laser_ablation.hpp
 * @brief Laser ablation phase engine.
 * @author Watosn
 */
#pragma once

#include "deflectsim/effects/core/phase_engine.hpp"

namespace deflectsim::effects {

/**
 * @brief Orbital laser platform ablating the asteroid surface.
 *
 * Phases: Targeting -> Beam -> Complete. The platform sits on the launch shell toward the
 * asteroid (captured on activation); while the beam is on, the ablation plume pushes the
 * asteroid away from the platform once per emission interval.
 */
class LaserAblationEngine final : public IPhaseEngine {
 public:
  /**
   * @brief Configuration for beam timing and ablation thrust.
   */
  struct Config {
    double targeting_duration_s{1.0};
    double beam_duration_s{8.0};
    double ablation_constant{0.03};
    double min_emission_interval_s{0.05};
  };

  LaserAblationEngine() : LaserAblationEngine(Config{}) {}
  explicit LaserAblationEngine(const Config& config);

  [[nodiscard]] EngineOutput tick(const EngineInput& input) override;
  [[nodiscard]] Technique technique() const override { return Technique::LaserAblation; }
  [[nodiscard]] deflectsim::core::Status config_status() const override { return config_status_; }

  [[nodiscard]] double total_duration_s() const { return config_.targeting_duration_s + config_.beam_duration_s; }

 private:
  void reset_progress();

  Config config_{};
  deflectsim::core::Status config_status_{deflectsim::core::Status::Ok};
  ActivationClock clock_{};
  EmissionGate emission_;
  OneShot complete_{};
  deflectsim::core::Vec3 source_position_{};
};

}  // namespace deflectsim::effects
