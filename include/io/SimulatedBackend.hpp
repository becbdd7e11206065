#pragma once
/** @file  SimulatedBackend.hpp
 *  @brief In-memory emulator stand-in for development without a real emulator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <optional>
#include <string>

#include "io/EmulatorBackend.hpp"

namespace retro {
  namespace io {

    /**
 * @class SimulatedBackend
 * @brief Echoes back whatever was last applied. Stores values verbatim;
 *        the running/demo invariant is the Supervisor's job.
 */
    class SimulatedBackend : public EmulatorBackend {
    public:
      SimulatedBackend() = default;

      core::ProbeReading probe() override;
      const char* name() const override { return "simulated"; }

      /// Store the desired state. No failure modes.
      void applyDevState(bool running, std::optional<std::string> demo);

    private:
      mutable std::mutex mtx_;
      bool running_{ false };
      std::optional<std::string> demo_{};
    };

  } // namespace io
} // namespace retro
