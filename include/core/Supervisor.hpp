#pragma once

/** @file  Supervisor.hpp
 *  @brief Public API for retro::core::Supervisor, the single owner of emulator state.
 *
 *  © 2025 Milo Medical — licensed under MIT.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "core/EmulatorState.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/StateStore.hpp"

namespace retro {
  namespace io {
    class EmulatorBackend;
    class SimulatedBackend;
  } // namespace io

  namespace core {

    /**
 * @class Supervisor
 * @brief Owns the canonical EmulatorState and keeps it in sync with whichever
 *        backend the current OperatingMode selects.
 *
 * * Every state write goes through one reconciliation critical section,
 *   entered by the background tick, mode switches, dev-state commands and
 *   forced refreshes alike. At most one backend query is in flight.
 * * Tick / refresh arriving while a query is in flight wait for it and return
 *   its result instead of probing again.
 * * Mode switch / dev-state commands wait for the in-flight query, then run
 *   their own against the (new) backend.
 * * `getStatus()` only copies the in-memory snapshot; it never waits on a probe.
 */
    class Supervisor {

    public:
      Supervisor(std::shared_ptr<io::EmulatorBackend> realBackend,
                 std::shared_ptr<io::SimulatedBackend> simBackend,
                 std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger,
                 std::chrono::milliseconds tickInterval = std::chrono::seconds{ 1 });
      ~Supervisor(); ///< stop()

      // ---- public API ----------------------------------------------------------
      EmulatorState getStatus() const; ///< current snapshot, no I/O
      EmulatorState setMode(OperatingMode mode);
      EmulatorState setDevState(bool running, std::optional<std::string> demo);
      EmulatorState reconcile(); ///< coalescing; joins an in-flight query if any
      EmulatorState refresh();   ///< caller-requested reconcile()

      OperatingMode mode() const;

      void start(); ///< launch the background tick thread
      void stop();  ///< wake + join the tick thread, lets an in-flight query finish

      /// Backend queries actually issued (coalesced callers don't count).
      std::uint64_t probeCount() const { return probeCount_.load(); }

      Supervisor(const Supervisor&) = delete;
      Supervisor& operator=(const Supervisor&) = delete;

    private:
      EmulatorState runReconcile(std::unique_lock<std::mutex>& lock);
      void waitIdle(std::unique_lock<std::mutex>& lock);
      ProbeReading readBackend(io::EmulatorBackend& backend, OperatingMode mode);
      EmulatorState fold(const ProbeReading& reading, OperatingMode mode,
                         const EmulatorState& prev) const;
      void logTransition(const EmulatorState& prev, const EmulatorState& next);
      std::shared_ptr<io::EmulatorBackend> backendFor(OperatingMode mode) const;
      void tickLoop();

      std::shared_ptr<io::EmulatorBackend> real_;
      std::shared_ptr<io::SimulatedBackend> sim_;
      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::shared_ptr<Logger> log_;
      const std::chrono::milliseconds interval_;

      StateStore store_;

      // reconciliation critical section
      mutable std::mutex syncMtx_;
      std::condition_variable syncCv_;
      OperatingMode mode_{ OperatingMode::REAL }; ///< guarded by syncMtx_
      bool inFlight_{ false };
      std::uint64_t startedGen_{ 0 };
      std::uint64_t completedGen_{ 0 };
      bool probeFailing_{ false }; ///< only touched by the in-flight owner

      std::atomic<std::uint64_t> probeCount_{ 0 };

      // background tick
      std::mutex tickMtx_;
      std::condition_variable tickCv_;
      bool stopping_{ false };
      std::thread ticker_;
    };

  } // namespace core
} // namespace retro
