#pragma once
/** @file  SystemMonitor.hpp
 *  @brief Host CPU / memory / temperature readout for the status endpoint.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace retro {
  namespace io {

    struct SystemStats {
      double cpuUsage{ 0.0 };             ///< percent since previous sample
      double memoryUsage{ 0.0 };          ///< percent of MemTotal in use
      std::optional<double> temperature{}; ///< degrees C, if a thermal zone exists
    };

    /// Resource use of the emulator process itself.
    struct ProcessStats {
      int pid{ 0 };
      double cpuPercent{ 0.0 };    ///< of one CPU (may exceed 100 on SMP), since previous sample
      double memoryPercent{ 0.0 }; ///< VmRSS against MemTotal
    };

    /**
 * @class SystemMonitor
 * @brief Reads /proc/stat, /proc/meminfo and a thermal zone.
 *
 *  * CPU usage is the delta against the previous call (0 on the first one),
 *    so nothing sleeps on the request path.
 *  * `sample()` returns nullopt when /proc cannot be read.
 *  * `sampleProcess(pid)` does the same for one process. Its CPU delta
 *    restarts when the pid changes.
 */
    class SystemMonitor {
    public:
      explicit SystemMonitor(std::string procRoot = "/proc",
                             std::string thermalPath = "/sys/class/thermal/thermal_zone0/temp");

      std::optional<SystemStats> sample();
      std::optional<ProcessStats> sampleProcess(int pid);

    private:
      struct CpuTimes {
        std::uint64_t idle{ 0 };
        std::uint64_t total{ 0 };
        unsigned cpus{ 0 }; ///< "cpuN" lines
      };

      struct MemInfo {
        std::uint64_t totalKb{ 0 };
        std::uint64_t availableKb{ 0 };
      };

      struct ProcessTimes {
        int pid{ 0 };
        std::uint64_t jiffies{ 0 }; ///< utime + stime
        std::uint64_t hostTotal{ 0 };
      };

      std::optional<CpuTimes> readCpu() const;
      std::optional<MemInfo> readMeminfo() const;
      std::optional<double> readTemperature() const;
      std::optional<std::uint64_t> readProcessJiffies(int pid) const;
      std::optional<std::uint64_t> readProcessRssKb(int pid) const;

      std::string procRoot_;
      std::string thermalPath_;

      std::mutex mtx_;
      std::optional<CpuTimes> prev_; ///< guarded by mtx_
      std::optional<ProcessTimes> prevProcess_; ///< guarded by mtx_
    };

  } // namespace io
} // namespace retro
