/**
 * @file engine_factory.cpp
 * @brief Technique-keyed construction of phase engines.
 * @author Watosn
 */

#include "deflectsim/effects/engine_factory.hpp"

namespace deflectsim::effects {

std::unique_ptr<IPhaseEngine> make_engine(Technique technique, const EngineConfigs& configs) {
  switch (technique) {
    case Technique::KineticImpactor:
      return std::make_unique<KineticImpactorEngine>(configs.kinetic_impactor);
    case Technique::NuclearDetonation:
      return std::make_unique<NuclearDetonationEngine>(configs.nuclear_detonation);
    case Technique::GravityTractor:
      return std::make_unique<GravityTractorEngine>(configs.gravity_tractor);
    case Technique::LaserAblation:
      return std::make_unique<LaserAblationEngine>(configs.laser_ablation);
    case Technique::IonBeamShepherd:
      return std::make_unique<IonBeamShepherdEngine>(configs.ion_beam_shepherd);
  }
  return nullptr;
}

}  // namespace deflectsim::effects
