#pragma once
/** @file  AgentError.hpp
 *  @brief Typed error carried across the Supervisor / HTTP boundary.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>

namespace retro::core {

  enum class ErrorKind : std::uint8_t { InvalidInput, InvalidOperation, ProbeUnavailable, Count };
  static_assert(static_cast<std::uint8_t>(ErrorKind::Count) == 3,
                "ErrorKind count changed please update toString and the HTTP status mapping");

  inline const char* toString(ErrorKind k) {
    switch (k) {
    case ErrorKind::InvalidInput:
      return "InvalidInput";
    case ErrorKind::InvalidOperation:
      return "InvalidOperation";
    case ErrorKind::ProbeUnavailable:
      return "ProbeUnavailable";
    default:
      return "Unknown";
    }
  }

  /**
   * @class AgentError
   * @brief runtime_error tagged with an ErrorKind.
   *
   *  * InvalidInput / InvalidOperation are surfaced to HTTP callers.
   *  * ProbeUnavailable never leaves the Supervisor; it is folded into state.
   */
  class AgentError : public std::runtime_error {
  public:
    AgentError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_{ kind } {}

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
  };

} // namespace retro::core
