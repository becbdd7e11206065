/* @file SystemMonitor.cpp
 * @brief /proc based host statistics
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <sstream>
#include <utility>

// RetroAgent headers
#include "io/ProcessProbe.hpp" // readSmallFile
#include "io/SystemMonitor.hpp"

using namespace retro::io;

SystemMonitor::SystemMonitor(std::string procRoot, std::string thermalPath)
    : procRoot_(std::move(procRoot)), thermalPath_(std::move(thermalPath)) {}

std::optional<SystemStats> SystemMonitor::sample() {
  auto cpu = readCpu();
  auto mem = readMeminfo();
  if (!cpu || !mem)
    return std::nullopt;

  SystemStats stats;
  const double used = static_cast<double>(mem->totalKb - std::min(mem->totalKb, mem->availableKb));
  stats.memoryUsage = 100.0 * used / static_cast<double>(mem->totalKb);
  stats.temperature = readTemperature();

  std::lock_guard<std::mutex> lock(mtx_);
  if (prev_ && cpu->total > prev_->total) {
    const double total = static_cast<double>(cpu->total - prev_->total);
    const double idle = static_cast<double>(cpu->idle >= prev_->idle ? cpu->idle - prev_->idle : 0);
    stats.cpuUsage = 100.0 * (total - idle) / total;
    if (stats.cpuUsage < 0.0)
      stats.cpuUsage = 0.0;
  }
  prev_ = cpu;
  return stats;
}

// -------------------------------------------------------------------
// SystemMonitor::sampleProcess
// cpuPercent = process jiffies / host jiffies * cpus, so one busy core
// reads 100. The first sample for a pid reports 0.
// -------------------------------------------------------------------
std::optional<ProcessStats> SystemMonitor::sampleProcess(int pid) {
  if (pid <= 0)
    return std::nullopt;

  auto jiffies = readProcessJiffies(pid);
  auto rss = readProcessRssKb(pid);
  auto cpu = readCpu();
  auto mem = readMeminfo();
  if (!jiffies || !rss || !cpu || !mem)
    return std::nullopt;

  ProcessStats stats;
  stats.pid = pid;
  stats.memoryPercent = 100.0 * static_cast<double>(std::min(*rss, mem->totalKb)) /
                        static_cast<double>(mem->totalKb);

  std::lock_guard<std::mutex> lock(mtx_);
  if (prevProcess_ && prevProcess_->pid == pid && cpu->total > prevProcess_->hostTotal &&
      *jiffies >= prevProcess_->jiffies) {
    const double host = static_cast<double>(cpu->total - prevProcess_->hostTotal);
    const double own = static_cast<double>(*jiffies - prevProcess_->jiffies);
    stats.cpuPercent = 100.0 * own / host * static_cast<double>(std::max(1u, cpu->cpus));
  }
  prevProcess_ = ProcessTimes{ pid, *jiffies, cpu->total };
  return stats;
}

// first line: "cpu  user nice system idle iowait irq softirq steal ..."
// followed by one "cpuN" line per CPU
std::optional<SystemMonitor::CpuTimes> SystemMonitor::readCpu() const {
  auto text = readSmallFile(procRoot_ + "/stat");
  if (!text)
    return std::nullopt;

  std::istringstream lines(*text);
  std::string line;
  if (!std::getline(lines, line))
    return std::nullopt;

  std::istringstream in(line);
  std::string label;
  in >> label;
  if (label != "cpu")
    return std::nullopt;

  CpuTimes t;
  std::uint64_t v = 0;
  int field = 0;
  while (in >> v) {
    t.total += v;
    if (field == 3 || field == 4) // idle + iowait
      t.idle += v;
    ++field;
  }
  if (field < 4)
    return std::nullopt;

  while (std::getline(lines, line)) {
    if (line.size() > 3 && line.compare(0, 3, "cpu") == 0 &&
        std::isdigit(static_cast<unsigned char>(line[3])))
      ++t.cpus;
  }
  return t;
}

std::optional<SystemMonitor::MemInfo> SystemMonitor::readMeminfo() const {
  auto text = readSmallFile(procRoot_ + "/meminfo");
  if (!text)
    return std::nullopt;

  std::istringstream in(*text);
  std::string key;
  std::uint64_t value = 0;
  std::string unit;
  std::optional<std::uint64_t> total, available;
  while (in >> key >> value) {
    std::getline(in, unit); // " kB" or empty
    if (key == "MemTotal:")
      total = value;
    else if (key == "MemAvailable:")
      available = value;
  }
  if (!total || !available || *total == 0)
    return std::nullopt;
  return MemInfo{ *total, *available };
}

std::optional<double> SystemMonitor::readTemperature() const {
  auto text = readSmallFile(thermalPath_);
  if (!text)
    return std::nullopt;
  std::istringstream in(*text);
  long milli = 0;
  if (!(in >> milli))
    return std::nullopt;
  return static_cast<double>(milli) / 1000.0;
}

// "<pid> (<comm>) <state> <ppid> ..."; comm may hold spaces and parens,
// so fields are counted from the last ')'. utime and stime are fields 14 and 15.
std::optional<std::uint64_t> SystemMonitor::readProcessJiffies(int pid) const {
  auto text = readSmallFile(procRoot_ + "/" + std::to_string(pid) + "/stat");
  if (!text)
    return std::nullopt;

  const auto close = text->rfind(')');
  if (close == std::string::npos)
    return std::nullopt;

  std::istringstream in(text->substr(close + 1));
  std::string token;
  std::uint64_t utime = 0, stime = 0;
  for (int field = 3; field <= 15; ++field) {
    if (!(in >> token))
      return std::nullopt;
    if (field == 14 || field == 15) {
      char* end = nullptr;
      const auto v = std::strtoull(token.c_str(), &end, 10);
      if (end == token.c_str() || *end != '\0')
        return std::nullopt;
      (field == 14 ? utime : stime) = v;
    }
  }
  return utime + stime;
}

std::optional<std::uint64_t> SystemMonitor::readProcessRssKb(int pid) const {
  auto text = readSmallFile(procRoot_ + "/" + std::to_string(pid) + "/status");
  if (!text)
    return std::nullopt;

  std::istringstream in(*text);
  std::string line;
  while (std::getline(in, line)) {
    if (line.compare(0, 6, "VmRSS:") != 0)
      continue;
    std::istringstream field(line.substr(6));
    std::uint64_t kb = 0;
    if (field >> kb)
      return kb;
    return std::nullopt;
  }
  // kernel threads and zombies have no VmRSS line
  return std::uint64_t{ 0 };
}
