#pragma once
/** @file  EmulatorState.hpp
 *  @brief Operating mode, backend readings and the canonical emulator snapshot.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace retro {
  namespace core {

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    /** Which backend the Supervisor consults. */
    enum class OperatingMode : std::uint8_t { REAL, SIMULATED, Count };
    static_assert(static_cast<std::uint8_t>(OperatingMode::Count) == 2,
                  "OperatingMode count changed please update toString/parseMode");

    inline const char* toString(OperatingMode m) {
      switch (m) {
      case OperatingMode::REAL:
        return "REAL";
      case OperatingMode::SIMULATED:
        return "SIMULATED";
      default:
        return "Unknown";
      }
    }

    /// Exact, case-sensitive parse. Throws AgentError{InvalidInput} on anything else.
    OperatingMode parseMode(std::string_view text);

    /**
     * @struct ProbeReading
     * @brief One fresh answer from a backend. Carries no timestamp and no mode;
     *        the Supervisor folds it into an EmulatorState.
     */
    struct ProbeReading {
      bool running{ false };
      std::optional<std::string> currentDemo{};
      std::optional<int> pid{}; ///< only the real probe knows this

      static ProbeReading notRunning() { return ProbeReading{}; }
    };

    /**
     * @struct EmulatorState
     * @brief Immutable-by-convention snapshot. Replaced as a whole, never patched.
     *
     *  * `currentDemo`, `pid` and `runningSince` are empty whenever `running` is false.
     *  * `lastUpdated` never goes backwards across successive snapshots.
     */
    struct EmulatorState {
      bool running{ false };
      std::optional<std::string> currentDemo{};
      TimePoint lastUpdated{};
      OperatingMode mode{ OperatingMode::REAL };
      std::optional<int> pid{};
      std::optional<TimePoint> runningSince{};

      /// "RUNNING" or "IDLE".
      const char* phase() const { return running ? "RUNNING" : "IDLE"; }

      /// Whole seconds between runningSince and lastUpdated, 0 when idle.
      std::int64_t uptimeSeconds() const;

      /// Field-wise equality ignoring lastUpdated.
      bool sameObservation(const EmulatorState& other) const;
    };

    /** ISO-8601 UTC with milliseconds, e.g. 2026-10-19T12:00:00.123Z */
    std::string formatTimestamp(TimePoint tp);

  } // namespace core
} // namespace retro
