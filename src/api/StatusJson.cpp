/* @file StatusJson.cpp
 * @brief EmulatorState / host stats → nlohmann::json
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "api/StatusJson.hpp"

namespace retro::api {

  nlohmann::json toJson(const std::optional<io::SystemStats>& stats) {
    if (!stats)
      return nlohmann::json::object();
    nlohmann::json j = { { "cpuUsage", stats->cpuUsage }, { "memoryUsage", stats->memoryUsage } };
    j["temperature"] = stats->temperature ? nlohmann::json(*stats->temperature) : nlohmann::json(nullptr);
    return j;
  }

  nlohmann::json toJson(const std::optional<io::ProcessStats>& process) {
    if (!process)
      return nullptr;
    return { { "pid", process->pid },
             { "cpuPercent", process->cpuPercent },
             { "memoryPercent", process->memoryPercent } };
  }

  nlohmann::json toJson(const core::EmulatorState& state,
                        const std::optional<io::SystemStats>& stats,
                        const std::optional<io::ProcessStats>& process) {
    nlohmann::json j;
    j["running"] = state.running;
    j["currentDemo"] = state.currentDemo ? nlohmann::json(*state.currentDemo) : nlohmann::json(nullptr);
    j["mode"] = core::toString(state.mode);
    // default-constructed snapshot: nothing has been observed yet
    j["lastUpdated"] = state.lastUpdated == core::TimePoint{}
                           ? nlohmann::json(nullptr)
                           : nlohmann::json(core::formatTimestamp(state.lastUpdated));
    j["state"] = state.phase();
    j["uptime"] = state.uptimeSeconds();
    j["pid"] = state.pid ? nlohmann::json(*state.pid) : nlohmann::json(nullptr);
    j["process"] = state.running ? toJson(process) : nlohmann::json(nullptr);
    j["systemStats"] = toJson(stats);
    return j;
  }

  nlohmann::json errorBody(const std::string& kind, const std::string& message) {
    return { { "status", "error" }, { "error", kind }, { "message", message } };
  }

} // namespace retro::api
