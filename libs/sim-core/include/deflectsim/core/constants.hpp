/**
 * @file constants.hpp
 * @brief Shared scene and physical constants.
 * @author Watosn
 */
#pragma once

#include "deflectsim/core/types.hpp"

namespace deflectsim::core::constants {

inline constexpr double kJoulesPerMegaton = 4.184e15;
inline constexpr double kMetersPerKilometer = 1000.0;
inline constexpr double kMetersPerMegameter = 1000000.0;

// Scene layout: Earth sits at the origin and spacecraft launch from a shell around it.
inline constexpr Vec3 kEarthPosition{0.0, 0.0, 0.0};
inline constexpr Vec3 kDefaultAsteroidBasePosition{35.0, 0.0, 0.0};
inline constexpr double kLaunchShellRadius = 25.0;

inline constexpr double kDefaultMinEmissionIntervalS = 0.05;

}  // namespace deflectsim::core::constants
