#pragma once
/** @file  EmulatorBackend.hpp
 *  @brief Abstract query surface shared by the real probe and the simulator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include "core/EmulatorState.hpp"

namespace retro::io {

  /**
 * @class EmulatorBackend
 * @brief Common polymorphic interface the Supervisor dispatches to.
 *
 *  * Pure read: a backend never sees or holds the canonical state.
 *  * May throw core::AgentError{ProbeUnavailable}; the Supervisor folds
 *    that into "not running".
 */
  class EmulatorBackend {
  public:
    virtual ~EmulatorBackend() = default;

    /** @brief Fresh reading of what the emulator is doing right now. */
    virtual core::ProbeReading probe() = 0;

    /** @brief Short name for logs ("process", "simulated", ...). */
    virtual const char* name() const = 0;
  };

} // namespace retro::io
