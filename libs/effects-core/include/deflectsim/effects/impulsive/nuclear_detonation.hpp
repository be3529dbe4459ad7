/**
 * @file nuclear_detonation.hpp
 * @brief Standoff nuclear detonation phase engine.
 * @author Watosn
 */
#pragma once

#include "deflectsim/effects/core/phase_engine.hpp"

namespace deflectsim::effects {

/**
 * @brief Standoff nuclear burst that either pushes the asteroid or disrupts it.
 *
 * Phases: Approach -> Detonation -> Complete | Destroyed. The target point is captured on
 * activation. When the yield reaches the disruption threshold no delta is applied and the
 * activation ends with `destroyed`; otherwise one delta is applied at the detonation instant
 * and the activation ends with `completed`. Exactly one terminal signal fires per activation.
 */
class NuclearDetonationEngine final : public IPhaseEngine {
 public:
  /**
   * @brief Configuration for burst timing, yield and standoff geometry.
   */
  struct Config {
    double approach_duration_s{3.0};
    double detonation_duration_s{2.0};
    double yield_mt{0.5};
    double disruption_threshold_mt{1.0};
    double deflection_magnitude{5.0};
    deflectsim::core::Vec3 standoff_offset{-2.0, 1.0, 0.0};
    double fireball_peak_scale{6.0};
  };

  NuclearDetonationEngine() : NuclearDetonationEngine(Config{}) {}
  explicit NuclearDetonationEngine(const Config& config);

  [[nodiscard]] EngineOutput tick(const EngineInput& input) override;
  [[nodiscard]] Technique technique() const override { return Technique::NuclearDetonation; }
  [[nodiscard]] deflectsim::core::Status config_status() const override { return config_status_; }

  /**
   * @brief True when the configured yield disrupts the asteroid instead of deflecting it.
   */
  [[nodiscard]] bool disrupts() const { return config_.yield_mt >= config_.disruption_threshold_mt; }

 private:
  void reset_progress();

  Config config_{};
  deflectsim::core::Status config_status_{deflectsim::core::Status::Ok};
  ActivationClock clock_{};
  OneShot detonation_{};
  OneShot terminal_{};
  deflectsim::core::Vec3 target_position_{};
  deflectsim::core::Vec3 launch_position_{};
};

}  // namespace deflectsim::effects
