#pragma once
/** @file  StateStore.hpp
 *  @brief Thread-safe holder of the single canonical EmulatorState.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>

#include "core/EmulatorState.hpp"

namespace retro {
  namespace core {

    /** @class StateStore
 *  @brief Lock-protected snapshot with whole-value replace.
 *
 *  * Readers copy the snapshot under the lock, so they only ever see a
 *    fully-formed value (never a half-written one).
 *  * `replace()` clamps `lastUpdated` so it never goes backwards.
 *  * Owned by the Supervisor; nothing else gets a reference.
 */
    class StateStore {

    public:
      StateStore() = default;
      ~StateStore() = default;

      /// Copy of the current snapshot.
      EmulatorState snapshot() const;

      /// Atomically swaps in \p next; returns what was actually stored.
      EmulatorState replace(EmulatorState next);

      StateStore(const StateStore&) = delete;
      StateStore& operator=(const StateStore&) = delete;

    private:
      mutable std::mutex mtx_;
      EmulatorState state_{}; ///< running=false, no demo, mode=REAL
    };

  } // namespace core
} // namespace retro
