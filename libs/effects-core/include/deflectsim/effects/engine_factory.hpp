/**
 * @file engine_factory.hpp
 * @brief Technique-keyed construction of phase engines.
 * @author Watosn
 */
#pragma once

#include <memory>

#include "deflectsim/effects/continuous/gravity_tractor.hpp"
#include "deflectsim/effects/continuous/ion_beam_shepherd.hpp"
#include "deflectsim/effects/continuous/laser_ablation.hpp"
#include "deflectsim/effects/core/phase_engine.hpp"
#include "deflectsim/effects/impulsive/kinetic_impactor.hpp"
#include "deflectsim/effects/impulsive/nuclear_detonation.hpp"

namespace deflectsim::effects {

/**
 * @brief Configuration bundle for every technique engine.
 */
struct EngineConfigs {
  KineticImpactorEngine::Config kinetic_impactor{};
  NuclearDetonationEngine::Config nuclear_detonation{};
  GravityTractorEngine::Config gravity_tractor{};
  LaserAblationEngine::Config laser_ablation{};
  IonBeamShepherdEngine::Config ion_beam_shepherd{};
};

/**
 * @brief Build a fresh engine instance for one activation of `technique`.
 */
[[nodiscard]] std::unique_ptr<IPhaseEngine> make_engine(Technique technique, const EngineConfigs& configs);

}  // namespace deflectsim::effects
