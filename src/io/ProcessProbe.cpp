/* @file ProcessProbe.cpp
 * @brief /proc scanner + status-file reader - Linux only
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <utility>

// Linux headers
#include <dirent.h> // opendir(), readdir()
#include <errno.h>
#include <fcntl.h>  // open()
#include <unistd.h> // read(), close()

// 3rd party headers
#include <nlohmann/json.hpp>

// RetroAgent headers
#include "io/ProcessProbe.hpp"

using namespace retro::io;

namespace {
  constexpr std::size_t kMaxFileBytes = 64 * 1024;

  std::string trim(const std::string& s) {
    auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string{};
  }

  std::optional<int> parsePid(const char* name) {
    if (!name || !*name)
      return std::nullopt;
    for (const char* p = name; *p; ++p)
      if (!std::isdigit(static_cast<unsigned char>(*p)))
        return std::nullopt;
    long v = std::strtol(name, nullptr, 10);
    if (v <= 0 || v > 0x3fffffff)
      return std::nullopt;
    return static_cast<int>(v);
  }

  std::string baseName(const std::string& path) {
    auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
  }

  std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
  }
} // namespace

namespace retro::io {

  // -------------------------------------------------------------------
  // readSmallFile
  // POSIX read loop, same pattern as the serial writer. /proc files
  // report size 0 so we cannot stat first; read until EOF or the cap.
  // -------------------------------------------------------------------
  std::optional<std::string> readSmallFile(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
      return std::nullopt;

    std::string out;
    char buf[1024];
    for (;;) {
      ssize_t n = ::read(fd, buf, sizeof(buf));
      if (n > 0) {
        out.append(buf, static_cast<std::size_t>(n));
        if (out.size() > kMaxFileBytes)
          break;
      } else if (n == 0) {
        break; // EOF
      } else if (errno == EINTR) {
        continue;
      } else {
        ::close(fd);
        return std::nullopt;
      }
    }
    ::close(fd);
    return out;
  }

} // namespace retro::io

ProcessProbe::ProcessProbe(ProbeSettings settings)
    : settings_(std::move(settings)), commName_(settings_.processName.substr(0, kCommMax)) {
  for (auto& ext : settings_.programExtensions)
    ext = toLower(ext);
}

retro::core::ProbeReading ProcessProbe::probe() {
  auto pid = findPid();
  if (!pid)
    return core::ProbeReading::notRunning();

  core::ProbeReading r;
  r.running = true;
  r.pid = pid;
  r.currentDemo = demoFromStatusFile(*pid);
  if (!r.currentDemo)
    r.currentDemo = demoFromCmdline(*pid);
  return r;
}

std::optional<int> ProcessProbe::findPid() const {
  if (commName_.empty())
    return std::nullopt;

  std::unique_ptr<DIR, int (*)(DIR*)> dir(::opendir(settings_.procRoot.c_str()), &::closedir);
  if (!dir)
    return std::nullopt;

  std::optional<int> best;
  while (dirent* ent = ::readdir(dir.get())) {
    auto pid = parsePid(ent->d_name);
    if (!pid)
      continue;
    if (best && *pid >= *best)
      continue;

    // process may exit between readdir and open; that is just "no match"
    auto comm = readSmallFile(settings_.procRoot + "/" + ent->d_name + "/comm");
    if (comm && trim(*comm) == commName_)
      best = pid;
  }
  return best;
}

std::optional<std::string> ProcessProbe::demoFromStatusFile(int pid) const {
  if (settings_.statusFile.empty())
    return std::nullopt;

  auto text = readSmallFile(settings_.statusFile);
  if (!text)
    return std::nullopt;

  const std::string body = trim(*text);
  if (body.empty())
    return std::nullopt;

  if (body.front() == '{') {
    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object())
      return std::nullopt;

    // a status file left over from an earlier run must not be trusted
    if (auto it = doc.find("pid"); it != doc.end()) {
      if (!it->is_number_integer() || it->get<long long>() != pid)
        return std::nullopt;
    }
    auto it = doc.find("demo");
    if (it == doc.end() || !it->is_string())
      return std::nullopt;
    std::string demo = trim(it->get<std::string>());
    if (demo.empty())
      return std::nullopt;
    return demo;
  }

  // plain text: first line is the demo id
  std::string first = trim(body.substr(0, body.find('\n')));
  if (first.empty())
    return std::nullopt;
  return first;
}

std::optional<std::string> ProcessProbe::demoFromCmdline(int pid) const {
  auto raw = readSmallFile(settings_.procRoot + "/" + std::to_string(pid) + "/cmdline");
  if (!raw || raw->empty())
    return std::nullopt;

  // NUL separated argv; skip argv[0]
  std::vector<std::string> args;
  std::size_t start = 0;
  while (start < raw->size()) {
    std::size_t end = raw->find('\0', start);
    if (end == std::string::npos)
      end = raw->size();
    args.emplace_back(raw->substr(start, end - start));
    start = end + 1;
  }

  for (std::size_t i = args.size(); i-- > 1;) {
    const std::string& arg = args[i];
    if (arg.empty() || arg.front() == '-')
      continue;
    if (looksLikeProgram(arg))
      return baseName(arg);
  }
  return std::nullopt;
}

bool ProcessProbe::looksLikeProgram(const std::string& arg) const {
  const std::string lower = toLower(baseName(arg));
  return std::any_of(settings_.programExtensions.begin(), settings_.programExtensions.end(),
                     [&](const std::string& ext) { return lower.ends_with(ext) && lower.size() > ext.size(); });
}
