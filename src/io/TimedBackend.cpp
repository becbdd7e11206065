/* @file TimedBackend.cpp
 * @brief bounded-wait probe runner
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

// RetroAgent headers
#include "core/AgentError.hpp"
#include "io/TimedBackend.hpp"

using namespace retro::io;
using retro::core::AgentError;
using retro::core::ErrorKind;

TimedBackend::TimedBackend(std::shared_ptr<EmulatorBackend> inner, std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), timeout_{ timeout },
      busy_(std::make_shared<std::atomic<bool>>(false)) {
  if (!inner_)
    throw std::invalid_argument("[TimedBackend] wrapped backend is nullptr");
  if (timeout_.count() <= 0)
    throw std::invalid_argument("[TimedBackend] timeout must be positive");
}

retro::core::ProbeReading TimedBackend::probe() {
  if (busy_->exchange(true)) {
    throw AgentError(ErrorKind::ProbeUnavailable,
                     std::string("[TimedBackend] previous ") + inner_->name() + " probe still outstanding");
  }

  std::future<core::ProbeReading> result;
  try {
    auto promise = std::make_shared<std::promise<core::ProbeReading>>();
    result = promise->get_future();
    spawn([inner = inner_, busy = busy_, promise] {
      core::ProbeReading reading;
      std::exception_ptr failure;
      try {
        reading = inner->probe();
      } catch (...) {
        failure = std::current_exception(); // re-thrown by result.get()
      }
      // release before publishing so a caller that got the result can probe again
      busy->store(false);
      if (failure)
        promise->set_exception(failure);
      else
        promise->set_value(std::move(reading));
    });
  } catch (...) {
    busy_->store(false); // no worker owns the flag
    throw;
  }

  if (result.wait_for(timeout_) != std::future_status::ready) {
    throw AgentError(ErrorKind::ProbeUnavailable,
                     std::string("[TimedBackend] ") + inner_->name() + " probe timed out after " +
                         std::to_string(timeout_.count()) + " ms");
  }
  return result.get();
}

void TimedBackend::spawn(std::function<void()> job) { std::thread(std::move(job)).detach(); }
