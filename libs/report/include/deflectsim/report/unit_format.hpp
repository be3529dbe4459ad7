/**
 * @file unit_format.hpp
 * @brief Human-scaled display strings for distances and energies.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>

namespace deflectsim::report {

/**
 * @brief Fixed-point rendering with `digits` decimals; exact halves round away from zero.
 */
[[nodiscard]] std::string format_fixed(double value, int digits);

/**
 * @brief Format a distance given in meters.
 *
 * Below 1 km renders as whole meters ("500 m"). From 1 km up to 1000 km renders as
 * kilometers with one decimal ("1.5 km"). From 1000 km upward the value is divided by 1e6
 * but keeps the "km" label ("2.5 km" for 2.5e6 m). Null renders as "N/A".
 */
[[nodiscard]] std::string format_distance(std::optional<double> meters);

/**
 * @brief Format an energy given in joules as Gigatons, Megatons or Kilotons of TNT.
 */
[[nodiscard]] std::string format_energy(double joules);

/**
 * @brief Convert megatons of TNT to joules.
 */
[[nodiscard]] double megatons_to_joules(double megatons);

}  // namespace deflectsim::report
