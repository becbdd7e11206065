/* @file StateStore.cpp
 * @brief canonical snapshot under a single mutex
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include <utility>

#include "core/StateStore.hpp"

using namespace retro::core;

EmulatorState StateStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return state_;
}

EmulatorState StateStore::replace(EmulatorState next) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (next.lastUpdated < state_.lastUpdated)
    next.lastUpdated = state_.lastUpdated; // wall clock stepped back
  state_ = std::move(next);
  return state_;
}
