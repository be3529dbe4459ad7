/**
 * @file effect_orchestrator.hpp
 * @brief Maps effect request flags to running phase engines and owns the asteroid state.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "deflectsim/core/constants.hpp"
#include "deflectsim/core/types.hpp"
#include "deflectsim/effects/engine_factory.hpp"
#include "deflectsim/scene/analysis_scan.hpp"
#include "deflectsim/scene/deflection_accumulator.hpp"
#include "deflectsim/scene/timer_queue.hpp"

namespace deflectsim::scene {

/**
 * @brief Request keys exposed to the UI: the five techniques plus the analysis scan.
 */
enum class EffectKey : std::uint8_t { KineticImpactor, NuclearDetonation, GravityTractor, LaserAblation, IonBeamShepherd, Analyze };

inline constexpr std::size_t kEffectKeyCount = 6;

[[nodiscard]] std::string_view effect_key_name(EffectKey key);
/**
 * @brief Parse a scene request key (`kineticImpactor`, ..., `analyze`).
 */
[[nodiscard]] std::optional<EffectKey> parse_effect_key(std::string_view name);
/**
 * @brief Technique for a deflection key; nullopt for `Analyze`.
 */
[[nodiscard]] std::optional<deflectsim::effects::Technique> to_technique(EffectKey key);
[[nodiscard]] EffectKey to_effect_key(deflectsim::effects::Technique technique);

/**
 * @brief Lifecycle transitions reported by the orchestrator.
 */
enum class LifecycleEventKind : std::uint8_t {
  Started,
  IgnoredRetrigger,
  Completed,
  Destroyed,
  Cancelled,
  RejectedConfig,
  OffsetReset,
  AsteroidHidden,
  AsteroidShown,
  ScanStarted,
  ReportRevealed,
  ScanClosed,
};

[[nodiscard]] std::string_view lifecycle_event_name(LifecycleEventKind kind);

/**
 * @brief One lifecycle transition. `effect` is empty for external visibility changes.
 */
struct LifecycleEvent {
  LifecycleEventKind kind{LifecycleEventKind::Started};
  std::optional<EffectKey> effect{};
  double time_s{};
};

/**
 * @brief Everything the renderer needs after one tick.
 */
struct TickReport {
  double now_s{};
  deflectsim::core::AsteroidState asteroid{};
  std::array<std::optional<deflectsim::effects::EngineOutput>, deflectsim::effects::kTechniqueCount> engines{};
  ScanOutput scan{};
  std::vector<LifecycleEvent> events{};
};

/**
 * @brief Starts, advances and retires technique engines against one shared asteroid.
 *
 * A rising edge on a request flag arms the technique. An armed technique starts when no
 * instance of it is running and the asteroid is visible; a rising edge while running is
 * dropped. Engines run to their own completion; hiding the asteroid is the only hard
 * cancellation. Post-completion resets are scheduled on a logical timer queue drained at
 * the start of each tick.
 */
class EffectOrchestrator final {
 public:
  /**
   * @brief Orchestrator configuration, including cooldown windows and engine configs.
   */
  struct Config {
    deflectsim::core::Vec3 asteroid_base_position{deflectsim::core::constants::kDefaultAsteroidBasePosition};
    deflectsim::effects::EngineConfigs engines{};
    AnalysisScanEngine::Config scan{};
    double beam_reset_delay_s{2.0};
    double nuclear_reset_delay_s{2.0};
    double blink_delay_s{3.0};
    double destroy_hidden_s{5.0};
  };

  EffectOrchestrator() : EffectOrchestrator(Config{}) {}
  explicit EffectOrchestrator(Config config);

  /**
   * @brief Update one external request flag.
   */
  void set_requested(EffectKey key, bool requested);
  [[nodiscard]] bool requested(EffectKey key) const;
  /**
   * @brief External visibility control. Hiding cancels running engines; showing clears the offset.
   */
  void set_asteroid_visible(bool visible);
  /**
   * @brief User dismissed the analysis report. Clears the analyze request latch.
   */
  void close_report();

  /**
   * @brief Advance timers, engines and the scan to clock reading `now_s`.
   */
  TickReport tick(double now_s);

  [[nodiscard]] bool is_running(deflectsim::effects::Technique technique) const;
  [[nodiscard]] deflectsim::core::AsteroidState asteroid() const;
  [[nodiscard]] const DeflectionAccumulator& accumulator() const { return accumulator_; }
  [[nodiscard]] const AnalysisScanEngine& scan() const { return scan_; }
  [[nodiscard]] std::size_t pending_actions() const { return timers_.size(); }
  [[nodiscard]] deflectsim::core::Status config_status() const { return config_status_; }

 private:
  struct Slot {
    bool requested{};
    bool armed{};
    std::unique_ptr<deflectsim::effects::IPhaseEngine> engine{};
  };

  void start_armed(double now_s);
  void cancel_running(double now_s);
  void run_due_actions(double now_s);
  void handle_completed(deflectsim::effects::Technique technique, double now_s);
  void handle_destroyed(deflectsim::effects::Technique technique, double now_s);
  void hide_until(double show_at_s, deflectsim::effects::Technique source, double now_s);
  void emit(LifecycleEventKind kind, std::optional<EffectKey> effect, double time_s);

  Config config_{};
  deflectsim::core::Status config_status_{deflectsim::core::Status::Ok};
  DeflectionAccumulator accumulator_;
  AnalysisScanEngine scan_;
  TimerQueue timers_{};
  std::array<Slot, deflectsim::effects::kTechniqueCount> slots_{};
  bool analysis_requested_{};
  bool analysis_armed_{};
  bool visible_{true};
  double last_tick_s_{};
  std::vector<LifecycleEvent> events_{};
};

}  // namespace deflectsim::scene
