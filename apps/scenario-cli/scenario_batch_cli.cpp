/**
 * @file scenario_batch_cli.cpp
 * @brief Batch deflection scenario CLI: scheduled request flags in, per-tick trace out.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "deflectsim/scene/effect_orchestrator.hpp"

namespace {

enum class CommandKind { Request, Visibility, CloseReport };

struct CommandRow {
  double time_s{};
  CommandKind kind{CommandKind::Request};
  deflectsim::scene::EffectKey key{deflectsim::scene::EffectKey::Analyze};
  bool value{};
};

bool parse_command_row(const std::string& line, CommandRow& out) {
  std::stringstream ss(line);
  std::string tok;
  std::vector<std::string> fields;
  while (std::getline(ss, tok, ',')) {
    fields.push_back(tok);
  }
  if (fields.size() != 3U || fields[0].empty()) {
    return false;
  }
  char* end = nullptr;
  out.time_s = std::strtod(fields[0].c_str(), &end);
  if (end == fields[0].c_str() || *end != '\0' || !std::isfinite(out.time_s)) {
    return false;
  }
  if (fields[2] != "0" && fields[2] != "1") {
    return false;
  }
  out.value = fields[2] == "1";

  if (fields[1] == "asteroidVisible") {
    out.kind = CommandKind::Visibility;
    return true;
  }
  if (fields[1] == "closeReport") {
    out.kind = CommandKind::CloseReport;
    return true;
  }
  const auto key = deflectsim::scene::parse_effect_key(fields[1]);
  if (!key.has_value()) {
    return false;
  }
  out.kind = CommandKind::Request;
  out.key = *key;
  return true;
}

void apply(deflectsim::scene::EffectOrchestrator& orchestrator, const CommandRow& row) {
  switch (row.kind) {
    case CommandKind::Request:
      orchestrator.set_requested(row.key, row.value);
      break;
    case CommandKind::Visibility:
      orchestrator.set_asteroid_visible(row.value);
      break;
    case CommandKind::CloseReport:
      if (row.value) {
        orchestrator.close_report();
      }
      break;
  }
}

std::string running_list(const deflectsim::scene::TickReport& r) {
  std::string s;
  for (const auto& engine : r.engines) {
    if (!engine.has_value()) {
      continue;
    }
    if (!s.empty()) {
      s += ';';
    }
    s += fmt::format("{}:{}", deflectsim::effects::technique_name(engine->technique),
                     deflectsim::effects::phase_name(engine->phase));
  }
  return s;
}

std::string event_list(const std::vector<deflectsim::scene::LifecycleEvent>& events) {
  std::string s;
  for (const auto& e : events) {
    if (!s.empty()) {
      s += ';';
    }
    s += deflectsim::scene::lifecycle_event_name(e.kind);
    if (e.effect.has_value()) {
      s += fmt::format("({})", deflectsim::scene::effect_key_name(*e.effect));
    }
  }
  return s;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3 || argc > 6) {
    spdlog::error("usage: deflect_scenario_batch_cli <input_csv> <output_csv> [tick_hz] [tail_s] [log_level]");
    spdlog::error("input row: time_s,effect,requested  (effect: technique key, analyze, asteroidVisible, closeReport)");
    return 1;
  }

  const std::filesystem::path input_csv = argv[1];
  const std::filesystem::path output_csv = argv[2];
  const double tick_hz = (argc >= 4) ? std::atof(argv[3]) : 60.0;
  const double tail_s = (argc >= 5) ? std::atof(argv[4]) : 25.0;
  if (argc >= 6) {
    spdlog::set_level(spdlog::level::from_str(argv[5]));
  }
  if (!(tick_hz > 0.0) || !(tail_s >= 0.0)) {
    spdlog::error("tick_hz must be positive and tail_s non-negative");
    return 2;
  }

  std::ifstream in(input_csv);
  if (!in) {
    spdlog::error("failed to open input csv: {}", input_csv.string());
    return 3;
  }

  std::vector<CommandRow> commands;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    CommandRow row{};
    if (!parse_command_row(line, row)) {
      if (line_no == 1 && line.find("time_s") != std::string::npos) {
        continue;
      }
      spdlog::warn("skipping malformed row {}", line_no);
      continue;
    }
    commands.push_back(row);
  }
  std::stable_sort(commands.begin(), commands.end(),
                   [](const CommandRow& a, const CommandRow& b) { return a.time_s < b.time_s; });

  std::ofstream out(output_csv);
  if (!out) {
    spdlog::error("failed to open output csv: {}", output_csv.string());
    return 4;
  }

  deflectsim::scene::EffectOrchestrator orchestrator;
  const double end_s = (commands.empty() ? 0.0 : commands.back().time_s) + tail_s;
  const double dt = 1.0 / tick_hz;
  const auto ticks = static_cast<long>(std::ceil(end_s * tick_hz));

  out << "t_s,offset_x,offset_y,offset_z,world_x,world_y,world_z,visible,running,scan_state,scan_pct,events\n";
  std::size_t next = 0;
  for (long i = 0; i <= ticks; ++i) {
    const double now_s = static_cast<double>(i) * dt;
    while (next < commands.size() && commands[next].time_s <= now_s) {
      apply(orchestrator, commands[next]);
      ++next;
    }
    const auto r = orchestrator.tick(now_s);
    out << fmt::format("{:.6f},{:.9f},{:.9f},{:.9f},{:.9f},{:.9f},{:.9f},{},{},{},{:.3f},{}\n", now_s,
                       r.asteroid.deflection_offset_m.x, r.asteroid.deflection_offset_m.y,
                       r.asteroid.deflection_offset_m.z, r.asteroid.world_position_m.x, r.asteroid.world_position_m.y,
                       r.asteroid.world_position_m.z, r.asteroid.visible ? 1 : 0, running_list(r),
                       deflectsim::scene::scan_state_name(r.scan.state), r.scan.progress_percent, event_list(r.events));
  }

  spdlog::info("wrote scenario trace: {} ({} commands, {} ticks)", output_csv.string(), commands.size(), ticks + 1);
  return 0;
}
