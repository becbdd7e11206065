/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault forwarder
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

#include "core/ErrorMonitor.hpp"

namespace retro {
  namespace core {
    ErrorMonitor::ErrorMonitor() = default;
    ErrorMonitor::~ErrorMonitor() = default;

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!rememberIfNew(message))
          return;
        cb = escalation_;
      }
      // call outside the lock, the callback may log and take its own locks
      if (cb)
        cb(message);
    }

    void ErrorMonitor::clear() {
      std::lock_guard<std::mutex> lock(mtx_);
      seen_.clear();
    }

    std::size_t ErrorMonitor::activeCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return seen_.size();
    }

    bool ErrorMonitor::rememberIfNew(const std::string& message) {
      if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
        return false;
      seen_.push_back(message);
      return true;
    }
  } // namespace core
} // namespace retro
