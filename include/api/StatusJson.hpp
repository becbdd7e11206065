#pragma once
/** @file  StatusJson.hpp
 *  @brief Wire format of status / error bodies (nlohmann::json).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/EmulatorState.hpp"
#include "io/SystemMonitor.hpp"

namespace retro::api {

  /// `{running, currentDemo, mode, lastUpdated, state, uptime, pid, process, systemStats}`
  /// `lastUpdated` is null until the first reconciliation.
  nlohmann::json toJson(const core::EmulatorState& state,
                        const std::optional<io::SystemStats>& stats,
                        const std::optional<io::ProcessStats>& process = std::nullopt);

  /// `{cpuUsage, memoryUsage, temperature}` or `{}` when unavailable.
  nlohmann::json toJson(const std::optional<io::SystemStats>& stats);

  /// `{pid, cpuPercent, memoryPercent}` or null.
  nlohmann::json toJson(const std::optional<io::ProcessStats>& process);

  /// `{"status":"error","error":<kind>,"message":<message>}`
  nlohmann::json errorBody(const std::string& kind, const std::string& message);

} // namespace retro::api
