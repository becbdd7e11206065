#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator for recoverable agent faults.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace retro::core {

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique message.
 *
 * * Thread-safe (mutex-protected vector).
 * * Debounces duplicate failures so a dead probe polled every second
 *   doesn't flood the log. `clear()` re-arms every message.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor();
    virtual ~ErrorMonitor();

    /// Register a lambda that escalates a fault (the agent wires this to the Logger).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; forwards to the escalation callback if new.
    virtual void notifyFailure(const std::string& message);

    /// Forget everything seen so far (called once the fault condition has cleared).
    virtual void clear();

    /// Number of distinct messages forwarded since the last clear().
    std::size_t activeCount() const;

  private:
    bool rememberIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace retro::core
