#pragma once
/** @file  TimedBackend.hpp
 *  @brief Decorator that bounds how long a backend probe may take.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "io/EmulatorBackend.hpp"

namespace retro {
  namespace io {

    /**
 * @class TimedBackend
 * @brief Runs the wrapped probe on a worker thread and waits at most `timeout`.
 *
 *  * On timeout throws core::AgentError{ProbeUnavailable}; the worker is
 *    abandoned (detached) and keeps its own shared reference to the backend.
 *  * While an abandoned probe is still stuck no new worker is spawned; calls
 *    fail fast with ProbeUnavailable instead of piling up threads.
 *  * Exceptions thrown by the wrapped probe are re-thrown to the caller.
 *  * If the worker cannot be started the error propagates and the next call
 *    tries again.
 */
    class TimedBackend : public EmulatorBackend {
    public:
      TimedBackend(std::shared_ptr<EmulatorBackend> inner, std::chrono::milliseconds timeout);

      core::ProbeReading probe() override;
      const char* name() const override { return inner_->name(); }

      std::chrono::milliseconds timeout() const { return timeout_; }

    protected:
      /// Runs \p job on a detached thread. May throw std::system_error.
      virtual void spawn(std::function<void()> job);

    private:
      std::shared_ptr<EmulatorBackend> inner_;
      std::chrono::milliseconds timeout_;
      std::shared_ptr<std::atomic<bool>> busy_; ///< a worker is still inside inner_->probe()
    };

  } // namespace io
} // namespace retro
