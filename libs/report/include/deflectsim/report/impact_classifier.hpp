/**
 * @file impact_classifier.hpp
 * @brief Impact-consequence classification and display-record construction.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deflectsim::report {

/**
 * @brief Global consequence category produced by the upstream impact model.
 */
enum class EarthEffect : std::uint8_t { Destroyed, StronglyDisturbed, NegligibleDisturbed };

/**
 * @brief Severity tier used by report views.
 */
enum class SeverityTier : std::uint8_t { Critical, Major, Minor };

/**
 * @brief Physics outputs of the upstream impact model.
 *
 * Field set mirrors the upstream record (`E_Mt`, `airburst`, `zb_breakup`,
 * `v_impact_for_crater`, `Rf_m`, `r_clothing_m`, `r_2nd_burn_m`, `r_3rd_burn_m`, `Dtc_m`,
 * `dtc_m`, `earth_effect`, `airblast_radius_building_collapse_m`,
 * `airblast_radius_glass_shatter_m`). Crater fields are null for airbursts.
 */
struct ImpactPhysicsRecord {
  double energy_mt{};
  bool airburst{};
  double breakup_altitude_m{};
  double impact_velocity_for_crater_mps{};
  std::optional<double> fireball_radius_m{};
  std::optional<double> clothing_ignition_radius_m{};
  std::optional<double> second_degree_burn_radius_m{};
  std::optional<double> third_degree_burn_radius_m{};
  std::optional<double> crater_diameter_m{};
  std::optional<double> crater_depth_m{};
  EarthEffect earth_effect{EarthEffect::NegligibleDisturbed};
  std::optional<double> building_collapse_radius_m{};
  std::optional<double> glass_shatter_radius_m{};
};

/**
 * @brief Severity tier and banner text for one earth-effect category.
 */
struct EarthEffectClass {
  SeverityTier tier{SeverityTier::Minor};
  std::string_view label{};
};

/**
 * @brief One labelled distance card in the report.
 */
struct DistanceCard {
  std::string value{};
  std::string label{};
};

/**
 * @brief Display-ready strings derived from one physics record.
 */
struct ImpactDisplayRecord {
  std::string location{};
  std::string energy{};
  std::string impact_type{};
  std::optional<std::string> breakup_altitude{};
  std::vector<DistanceCard> thermal{};
  std::vector<DistanceCard> blast{};
  std::vector<DistanceCard> crater{};
  SeverityTier severity{SeverityTier::Minor};
  std::string earth_effect_label{};
};

[[nodiscard]] std::string_view earth_effect_name(EarthEffect effect);
/**
 * @brief Parse the upstream category key (`destroyed`, `strongly_disturbed`, `negligible_disturbed`).
 */
[[nodiscard]] std::optional<EarthEffect> parse_earth_effect(std::string_view key);
[[nodiscard]] std::string_view severity_tier_name(SeverityTier tier);

/**
 * @brief Direct lookup from the record's earth-effect category to tier and label.
 */
[[nodiscard]] EarthEffectClass classify_earth_effect(const ImpactPhysicsRecord& record);

/**
 * @brief Build the full display record for an impact at the given location.
 *
 * Cards whose value is null or zero are omitted. Crater cards appear only for surface
 * impacts with a crater diameter.
 */
[[nodiscard]] ImpactDisplayRecord build_display_record(const ImpactPhysicsRecord& record, double impact_lat_deg,
                                                       double impact_lon_deg);

}  // namespace deflectsim::report
