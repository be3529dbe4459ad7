/**
 * @file test_impact_classifier.cpp
 * @brief Earth-effect classification and display-record checks.
 * @author Watosn
 */

#include <string>

#include <spdlog/spdlog.h>

#include "deflectsim/report/impact_classifier.hpp"

int main() {
  using namespace deflectsim::report;

  ImpactPhysicsRecord destroyed{};
  destroyed.earth_effect = EarthEffect::Destroyed;
  const auto c0 = classify_earth_effect(destroyed);
  if (c0.tier != SeverityTier::Critical || c0.label.empty()) {
    spdlog::error("destroyed should be critical with a label");
    return 1;
  }

  ImpactPhysicsRecord negligible{};
  negligible.earth_effect = EarthEffect::NegligibleDisturbed;
  if (classify_earth_effect(negligible).tier != SeverityTier::Minor) {
    spdlog::error("negligible_disturbed should be minor");
    return 2;
  }

  ImpactPhysicsRecord strong{};
  strong.earth_effect = EarthEffect::StronglyDisturbed;
  if (classify_earth_effect(strong).tier != SeverityTier::Major) {
    spdlog::error("strongly_disturbed should be major");
    return 3;
  }

  const auto parsed = parse_earth_effect("strongly_disturbed");
  if (!parsed.has_value() || *parsed != EarthEffect::StronglyDisturbed || parse_earth_effect("apocalypse").has_value()) {
    spdlog::error("earth effect parse mismatch");
    return 4;
  }
  if (earth_effect_name(EarthEffect::NegligibleDisturbed) != "negligible_disturbed" ||
      severity_tier_name(SeverityTier::Critical) != "critical") {
    spdlog::error("name lookup mismatch");
    return 5;
  }

  // Airburst: crater fields are null and must not render; breakup altitude must.
  ImpactPhysicsRecord airburst{};
  airburst.energy_mt = 10.0;
  airburst.airburst = true;
  airburst.breakup_altitude_m = 12500.0;
  airburst.third_degree_burn_radius_m = 8000.0;
  airburst.second_degree_burn_radius_m = 0.0;
  airburst.building_collapse_radius_m = 4000.0;
  airburst.glass_shatter_radius_m = 2500000.0;
  airburst.earth_effect = EarthEffect::NegligibleDisturbed;

  const auto a = build_display_record(airburst, 45.25, -120.5);
  if (a.location != "45.3°N, -120.5°E") {
    spdlog::error("location mismatch: {}", a.location);
    return 6;
  }
  if (a.energy != "10.0 Megatons" || a.impact_type != "Airburst") {
    spdlog::error("energy/type mismatch: {} {}", a.energy, a.impact_type);
    return 7;
  }
  if (!a.breakup_altitude.has_value() || *a.breakup_altitude != "12.5 km") {
    spdlog::error("breakup altitude mismatch");
    return 8;
  }
  if (a.thermal.size() != 1U || a.thermal[0].label != "Third Degree Burns" || a.thermal[0].value != "8.0 km") {
    spdlog::error("zero-valued burn card should be omitted");
    return 9;
  }
  if (a.blast.size() != 2U || a.blast[1].value != "2.5 km") {
    spdlog::error("blast cards mismatch");
    return 10;
  }
  if (!a.crater.empty() || a.severity != SeverityTier::Minor || a.earth_effect_label != "Local Effects - Limited Impact") {
    spdlog::error("airburst crater/banner mismatch");
    return 11;
  }

  // Surface impact with a crater.
  ImpactPhysicsRecord surface{};
  surface.energy_mt = 0.1;
  surface.airburst = false;
  surface.crater_diameter_m = 1500.0;
  surface.crater_depth_m = 300.0;
  surface.earth_effect = EarthEffect::Destroyed;

  const auto s = build_display_record(surface, 0.0, 0.0);
  if (s.impact_type != "Surface Impact" || s.breakup_altitude.has_value() || s.energy != "100.0 Kilotons") {
    spdlog::error("surface impact header mismatch");
    return 12;
  }
  if (s.crater.size() != 2U || s.crater[0].value != "1.5 km" || s.crater[1].value != "300 m") {
    spdlog::error("crater cards mismatch");
    return 13;
  }
  if (!s.thermal.empty() || !s.blast.empty() || s.severity != SeverityTier::Critical) {
    spdlog::error("null cards should be omitted");
    return 14;
  }

  return 0;
}
