/* @file Logger.cpp
 * @brief bounded queue + single writer thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <ctime>
#include <iostream>
#include <sstream>
#include <utility>

// RetroAgent headers
#include "core/Logger.hpp"
#include "io/FileLogger.hpp"

using namespace retro::core;

namespace {
  thread_local std::string tlsThreadName;

  std::string currentThreadName() {
    if (!tlsThreadName.empty())
      return tlsThreadName;
    std::ostringstream os;
    os << "T" << std::this_thread::get_id();
    return os.str();
  }
} // namespace

Logger::Logger(LogLevel minLevel, std::size_t capacity)
    : minLevel_{ minLevel }, capacity_{ capacity == 0 ? 1 : capacity }, stream_{ &std::cerr } {}

Logger::~Logger() { stop(); }

void Logger::setStream(std::ostream* os) {
  std::lock_guard<std::mutex> lock(sinkMtx_);
  stream_ = os;
}

void Logger::attachFile(std::unique_ptr<io::FileLogger> sink) {
  std::lock_guard<std::mutex> lock(sinkMtx_);
  file_ = std::move(sink);
}

void Logger::setThreadName(const std::string& name) { tlsThreadName = name; }

void Logger::start() {
  if (running_.exchange(true))
    return;
  {
    std::lock_guard<std::mutex> lock(queueMtx_);
    stopRequested_ = false;
  }
  worker_ = std::thread([this] { workerLoop(); });
}

void Logger::log(LogEvent event) {
  if (event.level < minLevel_.load())
    return;
  if (event.when == TimePoint{})
    event.when = Clock::now();
  if (event.thread.empty())
    event.thread = currentThreadName();

  {
    std::lock_guard<std::mutex> lock(queueMtx_);
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(std::move(event));
  }
  queueCv_.notify_one();
}

void Logger::stop() {
  if (running_.exchange(false)) {
    {
      std::lock_guard<std::mutex> lock(queueMtx_);
      stopRequested_ = true;
    }
    queueCv_.notify_all();
    if (worker_.joinable())
      worker_.join();
  }

  // anything logged before start() or racing the join
  std::deque<LogEvent> rest;
  {
    std::lock_guard<std::mutex> lock(queueMtx_);
    rest.swap(queue_);
  }
  writeBatch(rest);

  std::lock_guard<std::mutex> lock(sinkMtx_);
  if (file_)
    file_->flush();
}

void Logger::debug(const std::string& component, const std::string& msg) {
  log(LogEvent{ LogLevel::Debug, component, msg, {}, {} });
}
void Logger::info(const std::string& component, const std::string& msg) {
  log(LogEvent{ LogLevel::Info, component, msg, {}, {} });
}
void Logger::warn(const std::string& component, const std::string& msg) {
  log(LogEvent{ LogLevel::Warn, component, msg, {}, {} });
}
void Logger::error(const std::string& component, const std::string& msg) {
  log(LogEvent{ LogLevel::Error, component, msg, {}, {} });
}

std::string Logger::format(const LogEvent& event) {
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(event.when.time_since_epoch()).count();
  std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm local{};
  localtime_r(&secs, &local);

  char stamp[32];
  std::size_t len = std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
  std::ostringstream os;
  os << std::string(stamp, len) << ',';
  const auto frac = ms % 1000;
  os << (frac < 100 ? "0" : "") << (frac < 10 ? "0" : "") << frac;
  os << " - " << event.thread << " - " << toString(event.level) << " - " << event.component
     << ": " << event.message;
  return os.str();
}

void Logger::workerLoop() {
  setThreadName("logger");
  std::deque<LogEvent> batch;
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(queueMtx_);
      queueCv_.wait(lock, [this] { return stopRequested_ || !queue_.empty(); });
      if (queue_.empty() && stopRequested_)
        return;
      batch.swap(queue_);
    }
    writeBatch(batch);
    batch.clear();
  }
}

void Logger::writeBatch(std::deque<LogEvent>& batch) {
  if (batch.empty())
    return;
  std::lock_guard<std::mutex> lock(sinkMtx_);
  for (const auto& ev : batch) {
    std::string line = format(ev);
    line += '\n';
    if (stream_)
      *stream_ << line;
    if (file_)
      file_->write(line);
  }
  if (stream_)
    stream_->flush();
}
