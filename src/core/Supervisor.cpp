/* @file Supervisor.cpp
 * @brief single-writer reconciliation of emulator state against the active backend
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

// RetroAgent headers
#include "core/AgentError.hpp"
#include "core/Supervisor.hpp"
#include "io/EmulatorBackend.hpp"
#include "io/SimulatedBackend.hpp"

using namespace retro::core;

namespace {
  constexpr const char* kTag = "Supervisor";

  std::string describe(const EmulatorState& s) {
    std::string out = s.phase();
    if (s.currentDemo)
      out += " demo=" + *s.currentDemo;
    if (s.pid)
      out += " pid=" + std::to_string(*s.pid);
    return out;
  }
} // namespace

Supervisor::Supervisor(std::shared_ptr<io::EmulatorBackend> realBackend,
                       std::shared_ptr<io::SimulatedBackend> simBackend,
                       std::shared_ptr<ErrorMonitor> errorMonitor, std::shared_ptr<Logger> logger,
                       std::chrono::milliseconds tickInterval)
    : real_(std::move(realBackend)), sim_(std::move(simBackend)),
      errorMonitor_(std::move(errorMonitor)), log_(std::move(logger)), interval_{ tickInterval } {
  if (!real_ || !sim_)
    throw std::invalid_argument("[Supervisor] backend is nullptr");
  if (!errorMonitor_)
    throw std::invalid_argument("[Supervisor] error monitor is nullptr");
  if (!log_)
    throw std::invalid_argument("[Supervisor] logger is nullptr");
  if (interval_.count() <= 0)
    throw std::invalid_argument("[Supervisor] tick interval must be positive");
}

Supervisor::~Supervisor() { stop(); }

EmulatorState Supervisor::getStatus() const { return store_.snapshot(); }

OperatingMode Supervisor::mode() const {
  std::lock_guard<std::mutex> lock(syncMtx_);
  return mode_;
}

EmulatorState Supervisor::setMode(OperatingMode mode) {
  std::unique_lock<std::mutex> lock(syncMtx_);
  waitIdle(lock);
  if (mode_ != mode)
    log_->info(kTag, std::string("mode ") + toString(mode_) + " -> " + toString(mode));
  mode_ = mode;
  return runReconcile(lock);
}

EmulatorState Supervisor::setDevState(bool running, std::optional<std::string> demo) {
  std::unique_lock<std::mutex> lock(syncMtx_);
  waitIdle(lock);
  if (mode_ != OperatingMode::SIMULATED) {
    throw AgentError(ErrorKind::InvalidOperation,
                     "Must be in SIMULATED mode to set state directly");
  }
  log_->info(kTag, std::string("dev state running=") + (running ? "true" : "false") +
                       (demo ? " demo=" + *demo : std::string{}));
  sim_->applyDevState(running, std::move(demo));
  return runReconcile(lock);
}

EmulatorState Supervisor::reconcile() {
  std::unique_lock<std::mutex> lock(syncMtx_);
  if (inFlight_) {
    // join the query already running against the current backend
    const auto gen = startedGen_;
    syncCv_.wait(lock, [&] { return completedGen_ >= gen; });
    return store_.snapshot();
  }
  return runReconcile(lock);
}

EmulatorState Supervisor::refresh() {
  log_->debug(kTag, "forced refresh");
  return reconcile();
}

void Supervisor::waitIdle(std::unique_lock<std::mutex>& lock) {
  syncCv_.wait(lock, [this] { return !inFlight_; });
}

// -------------------------------------------------------------------
// Supervisor::runReconcile
// Caller holds syncMtx_ and nothing is in flight. The probe itself runs
// unlocked; mode_ cannot change meanwhile because every writer of mode_
// first waits for inFlight_ to clear.
// -------------------------------------------------------------------
EmulatorState Supervisor::runReconcile(std::unique_lock<std::mutex>& lock) {
  inFlight_ = true;
  const auto gen = ++startedGen_;
  const OperatingMode mode = mode_;
  auto backend = backendFor(mode);
  lock.unlock();

  EmulatorState next;
  try {
    ProbeReading reading = readBackend(*backend, mode);
    EmulatorState prev = store_.snapshot();
    next = store_.replace(fold(reading, mode, prev));
    logTransition(prev, next);
  } catch (...) {
    lock.lock();
    inFlight_ = false;
    completedGen_ = gen;
    syncCv_.notify_all();
    throw;
  }

  lock.lock();
  inFlight_ = false;
  completedGen_ = gen;
  syncCv_.notify_all();
  return next;
}

ProbeReading Supervisor::readBackend(io::EmulatorBackend& backend, OperatingMode mode) {
  ++probeCount_;
  std::string failure;
  try {
    ProbeReading reading = backend.probe();
    if (probeFailing_ && mode == OperatingMode::REAL) {
      probeFailing_ = false;
      errorMonitor_->clear();
      log_->info(kTag, std::string(backend.name()) + " probe recovered");
    }
    return reading;
  } catch (const AgentError& e) {
    failure = std::string(toString(e.kind())) + ": " + e.what();
  } catch (const std::exception& e) {
    failure = std::string("backend error: ") + e.what();
  }

  // fail soft: an unreachable probe means "not running"
  if (mode == OperatingMode::REAL)
    probeFailing_ = true;
  log_->warn(kTag, std::string(backend.name()) + " probe failed, assuming not running (" + failure + ")");
  errorMonitor_->notifyFailure("[Supervisor] " + failure);
  return ProbeReading::notRunning();
}

EmulatorState Supervisor::fold(const ProbeReading& reading, OperatingMode mode,
                               const EmulatorState& prev) const {
  EmulatorState next;
  next.mode = mode;
  next.lastUpdated = Clock::now();
  next.running = reading.running;

  if (next.running) {
    if (reading.currentDemo && !reading.currentDemo->empty())
      next.currentDemo = reading.currentDemo;
    next.pid = reading.pid;
    const bool sameRun = prev.running && prev.mode == mode && prev.pid == next.pid;
    next.runningSince = sameRun && prev.runningSince ? prev.runningSince : next.lastUpdated;
  }
  // stopped emulator: no demo, no pid, no run start
  return next;
}

void Supervisor::logTransition(const EmulatorState& prev, const EmulatorState& next) {
  if (prev.sameObservation(next))
    return;
  log_->info(kTag, std::string("[") + toString(next.mode) + "] " + describe(prev) + " -> " +
                       describe(next));
}

std::shared_ptr<retro::io::EmulatorBackend> Supervisor::backendFor(OperatingMode mode) const {
  switch (mode) {
  case OperatingMode::SIMULATED:
    return sim_;
  case OperatingMode::REAL:
  default:
    return real_;
  }
}

void Supervisor::start() {
  std::lock_guard<std::mutex> lock(tickMtx_);
  if (ticker_.joinable())
    return;
  stopping_ = false;
  ticker_ = std::thread([this] { tickLoop(); });
}

void Supervisor::stop() {
  {
    std::lock_guard<std::mutex> lock(tickMtx_);
    stopping_ = true;
  }
  tickCv_.notify_all();
  if (ticker_.joinable())
    ticker_.join(); // an in-flight reconcile on the ticker completes first
}

void Supervisor::tickLoop() {
  Logger::setThreadName("reconcile");
  log_->debug(kTag, "reconciliation loop started, interval " + std::to_string(interval_.count()) + " ms");

  std::unique_lock<std::mutex> lock(tickMtx_);
  while (!stopping_) {
    lock.unlock();
    try {
      reconcile();
    } catch (const std::exception& e) {
      log_->error(kTag, std::string("reconciliation tick failed: ") + e.what());
    }
    lock.lock();
    tickCv_.wait_for(lock, interval_, [this] { return stopping_; });
  }
  log_->debug(kTag, "reconciliation loop stopped");
}
