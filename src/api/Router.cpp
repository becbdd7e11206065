/* @file Router.cpp
 * @brief request → Supervisor translation and error mapping
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <utility>

// RetroAgent headers
#include "api/Router.hpp"
#include "api/StatusJson.hpp"
#include "core/AgentError.hpp"
#include "core/Logger.hpp"
#include "core/Supervisor.hpp"
#include "io/SystemMonitor.hpp"

using namespace retro::api;
using retro::core::AgentError;
using retro::core::ErrorKind;

namespace {
  constexpr const char* kTag = "HTTP";

  int httpStatusFor(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput:
      return 400;
    case ErrorKind::InvalidOperation:
      return 409;
    case ErrorKind::ProbeUnavailable:
      return 503;
    default:
      return 500;
    }
  }

  nlohmann::json parseObject(const std::string& body) {
    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object())
      throw AgentError(ErrorKind::InvalidInput, "Request body must be a JSON object");
    return doc;
  }

  // JSON booleans, or the strings "true"/"false" in any case
  bool parseRunning(const nlohmann::json& v) {
    if (v.is_boolean())
      return v.get<bool>();
    if (v.is_string()) {
      std::string s = v.get<std::string>();
      std::transform(s.begin(), s.end(), s.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (s == "true")
        return true;
      if (s == "false")
        return false;
    }
    throw AgentError(ErrorKind::InvalidInput, "'running' must be a boolean");
  }
} // namespace

Router::Router(std::shared_ptr<core::Supervisor> supervisor,
               std::shared_ptr<io::SystemMonitor> monitor, std::shared_ptr<core::Logger> logger)
    : supervisor_(std::move(supervisor)), monitor_(std::move(monitor)), log_(std::move(logger)) {
  if (!supervisor_)
    throw std::invalid_argument("[Router] supervisor is nullptr");
  if (!log_)
    throw std::invalid_argument("[Router] logger is nullptr");
}

Reply Router::handle(const std::string& method, const std::string& path, const std::string& body) {
  Reply reply;
  try {
    reply = dispatch(method, path, body);
  } catch (const AgentError& e) {
    reply = Reply{ httpStatusFor(e.kind()), errorBody(core::toString(e.kind()), e.what()) };
  } catch (const std::exception& e) {
    log_->error(kTag, method + " " + path + " failed: " + e.what());
    reply = Reply{ 500, errorBody("Internal", e.what()) };
  }
  log_->debug(kTag, method + " " + path + " -> " + std::to_string(reply.status));
  return reply;
}

Reply Router::dispatch(const std::string& method, const std::string& path, const std::string& body) {
  const bool isGet = method == "GET";
  const bool isPost = method == "POST";

  if (path == "/status") {
    if (isGet)
      return getStatus();
  } else if (path == "/status/refresh") {
    if (isPost)
      return postRefresh();
  } else if (path == "/dev/mode") {
    if (isPost)
      return postMode(body);
  } else if (path == "/dev/state") {
    if (isPost)
      return postDevState(body);
  } else {
    return Reply{ 404, errorBody("NotFound", "Endpoint not found: " + path) };
  }
  return Reply{ 405, errorBody("MethodNotAllowed", method + " not allowed on " + path) };
}

Reply Router::getStatus() { return snapshotReply(supervisor_->getStatus()); }

Reply Router::postRefresh() { return snapshotReply(supervisor_->refresh()); }

Reply Router::postMode(const std::string& body) {
  auto doc = parseObject(body);
  auto it = doc.find("mode");
  if (it == doc.end() || !it->is_string())
    throw AgentError(ErrorKind::InvalidInput, "'mode' must be one of [REAL, SIMULATED]");
  const auto mode = core::parseMode(it->get<std::string>());
  return snapshotReply(supervisor_->setMode(mode));
}

Reply Router::postDevState(const std::string& body) {
  auto doc = parseObject(body);

  auto running = doc.find("running");
  if (running == doc.end())
    throw AgentError(ErrorKind::InvalidInput, "'running' is required");

  std::optional<std::string> demo;
  if (auto it = doc.find("demo"); it != doc.end() && !it->is_null()) {
    if (!it->is_string())
      throw AgentError(ErrorKind::InvalidInput, "'demo' must be a string or null");
    demo = it->get<std::string>();
  }
  return snapshotReply(supervisor_->setDevState(parseRunning(*running), std::move(demo)));
}

Reply Router::snapshotReply(const core::EmulatorState& state) {
  std::optional<io::SystemStats> stats;
  std::optional<io::ProcessStats> process;
  if (monitor_) {
    stats = monitor_->sample();
    if (!stats)
      log_->warn(kTag, "system stats unavailable");
    if (state.running && state.pid)
      process = monitor_->sampleProcess(*state.pid); // gone already: null, not an error
  }
  return Reply{ 200, toJson(state, stats, process) };
}
