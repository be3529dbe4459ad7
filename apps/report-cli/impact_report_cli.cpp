/**
 * @file impact_report_cli.cpp
 * @brief Impact consequence report CLI.
 * @author Watosn
 */

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "deflectsim/report/impact_classifier.hpp"

namespace {

// "null" or "-" marks a field the impact model did not produce.
std::optional<double> optional_arg(int argc, char** argv, int index) {
  if (argc <= index) {
    return std::nullopt;
  }
  const std::string s = argv[index];
  if (s == "null" || s == "-") {
    return std::nullopt;
  }
  return std::atof(s.c_str());
}

void print_cards(const char* title, const std::vector<deflectsim::report::DistanceCard>& cards) {
  if (cards.empty()) {
    return;
  }
  fmt::print("{}\n", title);
  for (const auto& c : cards) {
    fmt::print("  {:<22} {}\n", c.label, c.value);
  }
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 6 || argc > 13) {
    spdlog::error(
        "usage: impact_report_cli <lat_deg> <lon_deg> <energy_mt> <airburst:0|1> <earth_effect:destroyed|strongly_disturbed|negligible_disturbed> [breakup_alt_m] [r_3rd_burn_m] [r_2nd_burn_m] [building_collapse_m] [glass_shatter_m] [crater_diameter_m] [crater_depth_m]");
    spdlog::error("optional fields accept 'null' or '-' for missing values");
    return 1;
  }

  const double lat = std::atof(argv[1]);
  const double lon = std::atof(argv[2]);
  const std::string effect_s = argv[5];
  const auto effect = deflectsim::report::parse_earth_effect(effect_s);
  if (!effect.has_value()) {
    spdlog::error("invalid earth_effect: {}", effect_s);
    return 2;
  }

  deflectsim::report::ImpactPhysicsRecord record{};
  record.energy_mt = std::atof(argv[3]);
  record.airburst = std::atoi(argv[4]) != 0;
  record.earth_effect = *effect;
  record.breakup_altitude_m = optional_arg(argc, argv, 6).value_or(0.0);
  record.third_degree_burn_radius_m = optional_arg(argc, argv, 7);
  record.second_degree_burn_radius_m = optional_arg(argc, argv, 8);
  record.building_collapse_radius_m = optional_arg(argc, argv, 9);
  record.glass_shatter_radius_m = optional_arg(argc, argv, 10);
  if (!record.airburst) {
    record.crater_diameter_m = optional_arg(argc, argv, 11);
    record.crater_depth_m = optional_arg(argc, argv, 12);
  }

  const auto view = deflectsim::report::build_display_record(record, lat, lon);
  fmt::print("Impact Location   {}\n", view.location);
  fmt::print("Impact Energy     {}\n", view.energy);
  fmt::print("Impact Type       {}\n", view.impact_type);
  if (view.breakup_altitude.has_value()) {
    fmt::print("Breakup Altitude  {}\n", *view.breakup_altitude);
  }
  print_cards("Thermal Effects", view.thermal);
  print_cards("Blast Effects", view.blast);
  print_cards("Crater", view.crater);
  fmt::print("[{}] {}\n", deflectsim::report::severity_tier_name(view.severity), view.earth_effect_label);
  return 0;
}
