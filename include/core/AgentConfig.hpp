#pragma once
/** @file  AgentConfig.hpp
 *  @brief Read-only startup configuration: defaults < JSON file < environment.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "io/ProcessProbe.hpp" // ProbeSettings

namespace retro::core {

  struct AgentConfig {
    // network
    std::string host{ "0.0.0.0" };
    std::uint16_t port{ 5000 };
    bool debug{ true };

    // emulator identification
    io::ProbeSettings probe{};

    // timing
    std::chrono::milliseconds reconcileInterval{ 1000 };
    std::chrono::milliseconds probeTimeout{ 2000 };

    std::string logFile{}; ///< "" = stderr only

    /// Overlay keys present in \p doc. Throws std::invalid_argument on wrong types.
    void applyJson(const nlohmann::json& doc);

    /// Overlay RETRO_AGENT_* variables. \p getenv is injectable for tests.
    void applyEnvironment(const std::function<std::optional<std::string>(const char*)>& getenv);

    /// Range checks; throws std::invalid_argument.
    void validate() const;
  };

  /// std::getenv wrapped as optional.
  std::optional<std::string> processEnv(const char* name);

  /// "true" in any case → true; anything else → false.
  bool parseBoolFlag(const std::string& text);

} // namespace retro::core
