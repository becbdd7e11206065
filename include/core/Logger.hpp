#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous line logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

#include "core/EmulatorState.hpp" // TimePoint

namespace retro {
  namespace io {
    class FileLogger;
  } // namespace io

  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

    inline const char* toString(LogLevel l) {
      switch (l) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warn:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "?";
      }
    }

    struct LogEvent {
      LogLevel level{ LogLevel::Info };
      std::string component; ///< e.g. "Supervisor"
      std::string message;
      TimePoint when{};
      std::string thread; ///< filled from the caller's thread tag
    };

    /**
 * @class Logger
 * @brief Callers enqueue, a single worker formats and writes.
 *
 *  * `log()` never touches a stream or file; it only takes the queue lock.
 *  * Queue is bounded; on overflow the oldest entry is dropped and counted.
 *  * Events below the minimum level are filtered before enqueueing.
 *  * Always writes to the attached stream (std::cerr unless replaced);
 *    additionally to a FileLogger when one is attached.
 */
    class Logger {

    public:
      explicit Logger(LogLevel minLevel = LogLevel::Info, std::size_t capacity = 1024);
      ~Logger(); ///< stop() + flush

      // --- setup (before start) ---
      void setStream(std::ostream* os);
      void attachFile(std::unique_ptr<io::FileLogger> sink);
      void setMinLevel(LogLevel lvl) { minLevel_.store(lvl); }

      // --- public API ---
      void start();                 ///< launch worker thread
      void log(LogEvent event);     ///< enqueue event (non-blocking)
      void stop();                  ///< drain + join worker thread

      void debug(const std::string& component, const std::string& msg);
      void info(const std::string& component, const std::string& msg);
      void warn(const std::string& component, const std::string& msg);
      void error(const std::string& component, const std::string& msg);

      std::uint64_t dropped() const { return dropped_.load(); }

      /// `<local time> - <thread> - <LEVEL> - <component>: <message>`
      static std::string format(const LogEvent& event);

      /// Tag used for events logged from the calling thread.
      static void setThreadName(const std::string& name);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void writeBatch(std::deque<LogEvent>& batch);

      std::atomic<LogLevel> minLevel_;
      const std::size_t capacity_;

      std::mutex queueMtx_;
      std::condition_variable queueCv_;
      std::deque<LogEvent> queue_;
      bool stopRequested_{ false };

      std::mutex sinkMtx_; ///< serialises stream/file writes (worker vs. final drain)
      std::ostream* stream_;
      std::unique_ptr<io::FileLogger> file_;

      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::uint64_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace retro
