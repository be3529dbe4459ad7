/**
 * @file analysis_scan.hpp
 * @brief Timed asteroid scan gating the impact-report reveal.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "deflectsim/core/types.hpp"

namespace deflectsim::scene {

/**
 * @brief Scan lifecycle: Idle -> Scanning -> Complete, back to Idle on close.
 */
enum class ScanState : std::uint8_t { Idle, Scanning, Complete };

[[nodiscard]] std::string_view scan_state_name(ScanState state);

/**
 * @brief Per-tick scan output. `reveal_report` is true only on the completing tick.
 */
struct ScanOutput {
  ScanState state{ScanState::Idle};
  double progress_percent{};
  bool reveal_report{};
};

/**
 * @brief Progress ramp from 0 to 100 % over a fixed duration. Never touches asteroid state.
 */
class AnalysisScanEngine final {
 public:
  /**
   * @brief Scan configuration.
   */
  struct Config {
    double scan_duration_s{3.0};
  };

  AnalysisScanEngine() : AnalysisScanEngine(Config{}) {}
  explicit AnalysisScanEngine(const Config& config);

  /**
   * @brief Start a scan at `now_s`.
   * @return False when already scanning or showing a completed report.
   */
  bool activate(double now_s);
  /**
   * @brief Sample progress at `now_s`.
   */
  [[nodiscard]] ScanOutput tick(double now_s);
  /**
   * @brief Dismiss the report (or abort a scan) and return to Idle.
   */
  void close();

  [[nodiscard]] ScanState state() const { return state_; }
  [[nodiscard]] double progress_percent() const { return progress_percent_; }
  [[nodiscard]] deflectsim::core::Status config_status() const { return config_status_; }

 private:
  Config config_{};
  deflectsim::core::Status config_status_{deflectsim::core::Status::Ok};
  ScanState state_{ScanState::Idle};
  std::optional<double> start_time_s_{};
  double progress_percent_{};
};

}  // namespace deflectsim::scene
