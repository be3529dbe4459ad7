/**
 * @file analysis_scan.cpp
 * @brief Timed asteroid scan implementation.
 * @author Watosn
 */

#include "deflectsim/scene/analysis_scan.hpp"

#include <algorithm>

namespace deflectsim::scene {

std::string_view scan_state_name(ScanState state) {
  switch (state) {
    case ScanState::Idle:
      return "idle";
    case ScanState::Scanning:
      return "scanning";
    case ScanState::Complete:
      return "complete";
  }
  return "unknown";
}

AnalysisScanEngine::AnalysisScanEngine(const Config& config)
    : config_(config),
      config_status_(config.scan_duration_s > 0.0 ? deflectsim::core::Status::Ok : deflectsim::core::Status::InvalidInput) {}

bool AnalysisScanEngine::activate(double now_s) {
  if (state_ != ScanState::Idle || config_status_ != deflectsim::core::Status::Ok) {
    return false;
  }
  state_ = ScanState::Scanning;
  start_time_s_ = now_s;
  progress_percent_ = 0.0;
  return true;
}

ScanOutput AnalysisScanEngine::tick(double now_s) {
  if (state_ != ScanState::Scanning || !start_time_s_.has_value()) {
    return ScanOutput{.state = state_, .progress_percent = progress_percent_};
  }

  const double fraction = std::clamp((now_s - *start_time_s_) / config_.scan_duration_s, 0.0, 1.0);
  progress_percent_ = fraction * 100.0;
  if (fraction < 1.0) {
    return ScanOutput{.state = state_, .progress_percent = progress_percent_};
  }

  state_ = ScanState::Complete;
  return ScanOutput{.state = state_, .progress_percent = progress_percent_, .reveal_report = true};
}

void AnalysisScanEngine::close() {
  state_ = ScanState::Idle;
  start_time_s_.reset();
  progress_percent_ = 0.0;
}

}  // namespace deflectsim::scene
