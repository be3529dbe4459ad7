/**
 * @file impact_classifier.cpp
 * @brief Impact-consequence classification and display-record construction.
 * @author Watosn
 */

#include "deflectsim/report/impact_classifier.hpp"

#include <cmath>

#include <fmt/format.h>

#include "deflectsim/report/unit_format.hpp"

namespace deflectsim::report {
namespace {

bool shown(const std::optional<double>& v) { return v.has_value() && *v != 0.0 && !std::isnan(*v); }

void add_card(std::vector<DistanceCard>& cards, const std::optional<double>& meters, const char* label) {
  if (shown(meters)) {
    cards.push_back(DistanceCard{.value = format_distance(meters), .label = label});
  }
}

}  // namespace

std::string_view earth_effect_name(EarthEffect effect) {
  switch (effect) {
    case EarthEffect::Destroyed:
      return "destroyed";
    case EarthEffect::StronglyDisturbed:
      return "strongly_disturbed";
    case EarthEffect::NegligibleDisturbed:
      return "negligible_disturbed";
  }
  return "unknown";
}

std::optional<EarthEffect> parse_earth_effect(std::string_view key) {
  if (key == "destroyed") {
    return EarthEffect::Destroyed;
  }
  if (key == "strongly_disturbed") {
    return EarthEffect::StronglyDisturbed;
  }
  if (key == "negligible_disturbed") {
    return EarthEffect::NegligibleDisturbed;
  }
  return std::nullopt;
}

std::string_view severity_tier_name(SeverityTier tier) {
  switch (tier) {
    case SeverityTier::Critical:
      return "critical";
    case SeverityTier::Major:
      return "major";
    case SeverityTier::Minor:
      return "minor";
  }
  return "unknown";
}

EarthEffectClass classify_earth_effect(const ImpactPhysicsRecord& record) {
  switch (record.earth_effect) {
    case EarthEffect::Destroyed:
      return EarthEffectClass{.tier = SeverityTier::Critical, .label = "Global Catastrophe - Earth Severely Affected"};
    case EarthEffect::StronglyDisturbed:
      return EarthEffectClass{.tier = SeverityTier::Major, .label = "Major Regional Effects - Significant Disturbance"};
    case EarthEffect::NegligibleDisturbed:
      return EarthEffectClass{.tier = SeverityTier::Minor, .label = "Local Effects - Limited Impact"};
  }
  return EarthEffectClass{.tier = SeverityTier::Minor, .label = "Local Effects - Limited Impact"};
}

ImpactDisplayRecord build_display_record(const ImpactPhysicsRecord& record, double impact_lat_deg, double impact_lon_deg) {
  ImpactDisplayRecord out{};
  out.location = fmt::format("{}°N, {}°E", format_fixed(impact_lat_deg, 1), format_fixed(impact_lon_deg, 1));
  out.energy = format_energy(megatons_to_joules(record.energy_mt));
  out.impact_type = record.airburst ? "Airburst" : "Surface Impact";
  if (record.airburst) {
    out.breakup_altitude = format_distance(record.breakup_altitude_m);
  }

  add_card(out.thermal, record.third_degree_burn_radius_m, "Third Degree Burns");
  add_card(out.thermal, record.second_degree_burn_radius_m, "Second Degree Burns");

  add_card(out.blast, record.building_collapse_radius_m, "Building Collapse");
  add_card(out.blast, record.glass_shatter_radius_m, "Window Breakage");

  if (!record.airburst && shown(record.crater_diameter_m)) {
    add_card(out.crater, record.crater_diameter_m, "Crater Diameter");
    add_card(out.crater, record.crater_depth_m, "Crater Depth");
  }

  const auto effect = classify_earth_effect(record);
  out.severity = effect.tier;
  out.earth_effect_label = std::string(effect.label);
  return out;
}

}  // namespace deflectsim::report
