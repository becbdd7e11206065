#pragma once
/** @file  ProcessProbe.hpp
 *  @brief Finds the real emulator process via /proc and works out what it runs.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>
#include <vector>

#include "io/EmulatorBackend.hpp"

namespace retro {
  namespace io {

    struct ProbeSettings {
      std::string processName{ "x64sc" };
      std::string procRoot{ "/proc" };
      std::string statusFile{}; ///< side-channel written by the launcher, "" = off
      std::vector<std::string> programExtensions{ ".prg", ".d64", ".t64", ".crt",
                                                  ".tap", ".g64", ".d81" };
    };

    /**
 * @class ProcessProbe
 * @brief Stateless, read-only view of the OS process table.
 *
 *  * Liveness: first `<procRoot>/<pid>/comm` equal to the process name
 *    (truncated to 15 chars the way the kernel does).
 *  * Demo: status file first (JSON `{"demo":..,"pid":..}` or one plain line),
 *    then the last program-looking argument in `cmdline`, else none.
 *  * Fails soft: every I/O problem ends up as "not running" / "no demo".
 */
    class ProcessProbe : public EmulatorBackend {
    public:
      static constexpr std::size_t kCommMax = 15; ///< TASK_COMM_LEN - 1

      explicit ProcessProbe(ProbeSettings settings);

      core::ProbeReading probe() override;
      const char* name() const override { return "process"; }

      const ProbeSettings& settings() const { return settings_; }

      //---helpers exposed for tests---------------------------------------
      /// Lowest pid whose comm matches, if any.
      std::optional<int> findPid() const;

      /// Demo from the status file, honouring an optional pid cross-check.
      std::optional<std::string> demoFromStatusFile(int pid) const;

      /// Demo from the process argument vector.
      std::optional<std::string> demoFromCmdline(int pid) const;

    private:
      bool looksLikeProgram(const std::string& arg) const;

      ProbeSettings settings_;
      std::string commName_; ///< processName truncated to kCommMax
    };

    /// Reads a whole (small) file; nullopt on any error.
    std::optional<std::string> readSmallFile(const std::string& path);

  } // namespace io
} // namespace retro
