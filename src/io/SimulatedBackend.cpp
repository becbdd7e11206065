/* @file SimulatedBackend.cpp
 * @brief dev-state holder behind SIMULATED mode
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// RetroAgent headers
#include "io/SimulatedBackend.hpp"

using namespace retro::io;

retro::core::ProbeReading SimulatedBackend::probe() {
  std::lock_guard<std::mutex> lock(mtx_);
  core::ProbeReading r;
  r.running = running_;
  r.currentDemo = demo_;
  return r;
}

void SimulatedBackend::applyDevState(bool running, std::optional<std::string> demo) {
  std::lock_guard<std::mutex> lock(mtx_);
  running_ = running;
  demo_ = std::move(demo);
}
