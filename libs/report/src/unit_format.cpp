/**
 * @file unit_format.cpp
 * @brief Distance and energy display formatting.
 * @author Watosn
 */

#include "deflectsim/report/unit_format.hpp"

#include <cmath>

#include <fmt/format.h>

#include "deflectsim/core/constants.hpp"

namespace deflectsim::report {

namespace constants = deflectsim::core::constants;

std::string format_fixed(double value, int digits) {
  const double scale = std::pow(10.0, digits);
  const double magnitude = std::abs(value);
  const double scaled = magnitude * scale;
  // Only an exactly representable half rounds away from zero; anything else fmt rounds correctly.
  if (std::isfinite(scaled) && std::fma(magnitude, scale, -scaled) == 0.0 && scaled - std::floor(scaled) == 0.5) {
    return fmt::format("{:.{}f}", std::copysign(std::floor(scaled + 0.5) / scale, value), digits);
  }
  return fmt::format("{:.{}f}", value, digits);
}

std::string format_distance(std::optional<double> meters) {
  if (!meters.has_value()) {
    return "N/A";
  }
  const double m = *meters;
  if (m >= constants::kMetersPerMegameter) {
    return format_fixed(m / constants::kMetersPerMegameter, 1) + " km";
  }
  if (m >= constants::kMetersPerKilometer) {
    return format_fixed(m / constants::kMetersPerKilometer, 1) + " km";
  }
  return format_fixed(m, 0) + " m";
}

std::string format_energy(double joules) {
  const double mt = joules / constants::kJoulesPerMegaton;
  if (mt >= 1000.0) {
    return format_fixed(mt / 1000.0, 1) + " Gigatons";
  }
  if (mt >= 1.0) {
    return format_fixed(mt, 1) + " Megatons";
  }
  return format_fixed(mt * 1000.0, 1) + " Kilotons";
}

double megatons_to_joules(double megatons) { return megatons * constants::kJoulesPerMegaton; }

}  // namespace deflectsim::report
