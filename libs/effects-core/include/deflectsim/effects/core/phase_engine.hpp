/**
 * @file phase_engine.hpp
 * @brief Generic deflection phase-engine interfaces and shared timing helpers.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "deflectsim/core/types.hpp"

namespace deflectsim::effects {

/**
 * @brief Closed set of deflection techniques.
 */
enum class Technique : std::uint8_t { KineticImpactor, NuclearDetonation, GravityTractor, LaserAblation, IonBeamShepherd };

inline constexpr std::size_t kTechniqueCount = 5;

/**
 * @brief Phase tag reported by an engine. Each technique uses an ordered subset.
 */
enum class Phase : std::uint8_t {
  Idle,
  Approach,
  Impact,
  Cooldown,
  Detonation,
  Targeting,
  StationKeeping,
  Beam,
  Complete,
  Destroyed,
};

/**
 * @brief Per-tick input to a phase engine.
 */
struct EngineInput {
  deflectsim::core::Vec3 asteroid_world_position{};
  bool is_active{};
  double now_s{};
};

/**
 * @brief Render-facing flags that vary by phase.
 */
struct VisualState {
  bool spacecraft_visible{};
  deflectsim::core::Vec3 spacecraft_position{};
  bool beam_visible{};
  double beam_intensity{};
  bool flash_visible{};
  double flash_scale{};
};

/**
 * @brief Per-tick output of a phase engine.
 *
 * `completed` and `destroyed` are true only on the tick where they fire, and never both.
 */
struct EngineOutput {
  Technique technique{Technique::KineticImpactor};
  Phase phase{Phase::Idle};
  std::optional<deflectsim::core::Vec3> deflection_delta{};
  bool completed{};
  bool destroyed{};
  VisualState visual{};
  deflectsim::core::Status status{deflectsim::core::Status::Ok};
};

/**
 * @brief Interface for one timed mitigation technique.
 */
class IPhaseEngine {
 public:
  virtual ~IPhaseEngine() = default;
  /**
   * @brief Advance the phase machine by one host tick.
   * @param input Asteroid position, active guard and clock reading.
   * @return Phase tag, optional delta and one-shot terminal signals.
   */
  [[nodiscard]] virtual EngineOutput tick(const EngineInput& input) = 0;
  /**
   * @brief Technique implemented by this engine.
   */
  [[nodiscard]] virtual Technique technique() const = 0;
  /**
   * @brief Result of config validation performed at construction.
   */
  [[nodiscard]] virtual deflectsim::core::Status config_status() const = 0;
};

/**
 * @brief Tracks activation edges and the start time captured on the first active tick.
 */
class ActivationClock {
 public:
  /**
   * @brief Update with this tick's guard and clock.
   * @return Seconds since activation, or nullopt while inactive.
   */
  std::optional<double> update(bool is_active, double now_s);
  /**
   * @brief True when the last update was the false->true edge.
   */
  [[nodiscard]] bool just_activated() const { return just_activated_; }
  [[nodiscard]] std::optional<double> start_time_s() const { return start_time_s_; }

 private:
  std::optional<double> start_time_s_{};
  bool just_activated_{};
};

/**
 * @brief Gate that opens at most once per activation.
 */
class OneShot {
 public:
  /**
   * @brief Returns true the first time it is called after a reset.
   */
  bool fire() {
    if (fired_) {
      return false;
    }
    fired_ = true;
    return true;
  }
  [[nodiscard]] bool fired() const { return fired_; }
  void reset() { fired_ = false; }

 private:
  bool fired_{};
};

/**
 * @brief Limits continuous delta emission to a minimum interval of engine time.
 *
 * The first call after a reset always opens.
 */
class EmissionGate {
 public:
  explicit EmissionGate(double min_interval_s) : min_interval_s_(min_interval_s) {}

  bool ready(double elapsed_s) {
    if (last_emit_s_.has_value() && elapsed_s - *last_emit_s_ < min_interval_s_) {
      return false;
    }
    last_emit_s_ = elapsed_s;
    return true;
  }
  void reset() { last_emit_s_.reset(); }

 private:
  double min_interval_s_{};
  std::optional<double> last_emit_s_{};
};

[[nodiscard]] std::string_view technique_name(Technique technique);
[[nodiscard]] std::string_view phase_name(Phase phase);
/**
 * @brief Parse the scene key of a technique (`kineticImpactor`, `gravityTractor`, ...).
 */
[[nodiscard]] std::optional<Technique> parse_technique(std::string_view key);

/**
 * @brief Unit direction of `v`; status is InvalidInput for zero or non-finite vectors.
 */
[[nodiscard]] deflectsim::core::Vec3 unit_direction(const deflectsim::core::Vec3& v, deflectsim::core::Status* status_out);

/**
 * @brief Spacecraft launch point on the launch shell, along the Earth->target direction.
 */
[[nodiscard]] deflectsim::core::Vec3 launch_position_toward(const deflectsim::core::Vec3& target);

/**
 * @brief Linear interpolation between two points, fraction clamped to [0, 1].
 */
[[nodiscard]] deflectsim::core::Vec3 interpolate(const deflectsim::core::Vec3& from, const deflectsim::core::Vec3& to,
                                                 double fraction);

/**
 * @brief Idle output used when the active guard is false.
 */
[[nodiscard]] inline EngineOutput idle_output(Technique technique, deflectsim::core::Status status) {
  return EngineOutput{.technique = technique, .phase = Phase::Idle, .status = status};
}

}  // namespace deflectsim::effects
