/* @file EmulatorState.cpp
 * @brief mode parsing, snapshot helpers and timestamp formatting
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <ctime>
#include <string>

// RetroAgent headers
#include "core/AgentError.hpp"
#include "core/EmulatorState.hpp"

namespace retro {
  namespace core {

    OperatingMode parseMode(std::string_view text) {
      if (text == "REAL")
        return OperatingMode::REAL;
      if (text == "SIMULATED")
        return OperatingMode::SIMULATED;
      throw AgentError(ErrorKind::InvalidInput, "Invalid monitor mode: " + std::string(text) +
                                                    ". Must be one of [REAL, SIMULATED]");
    }

    std::int64_t EmulatorState::uptimeSeconds() const {
      if (!running || !runningSince)
        return 0;
      auto secs = std::chrono::duration_cast<std::chrono::seconds>(lastUpdated - *runningSince);
      return secs.count() < 0 ? 0 : secs.count();
    }

    bool EmulatorState::sameObservation(const EmulatorState& other) const {
      return running == other.running && currentDemo == other.currentDemo &&
             mode == other.mode && pid == other.pid;
    }

    std::string formatTimestamp(TimePoint tp) {
      const auto ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
      std::time_t secs = static_cast<std::time_t>(ms / 1000);
      int millis = static_cast<int>(ms % 1000);
      if (millis < 0) { // pre-epoch
        millis += 1000;
        --secs;
      }

      std::tm utc{};
      gmtime_r(&secs, &utc);

      char buf[32];
      std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", utc.tm_year + 1900,
                    utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
      return buf;
    }

  } // namespace core
} // namespace retro
