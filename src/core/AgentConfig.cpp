/* @file AgentConfig.cpp
 * @brief config layering and validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

// 3rd party headers
#include <nlohmann/json.hpp>

#include "core/AgentConfig.hpp"

namespace retro::core {

  namespace {
    using json = nlohmann::json;

    template <typename Check>
    const json* field(const json& doc, const char* key, Check isRightType, const char* expected) {
      auto it = doc.find(key);
      if (it == doc.end())
        return nullptr;
      if (!isRightType(*it))
        throw std::invalid_argument(std::string("[AgentConfig] '") + key + "' must be " + expected);
      return &*it;
    }

    std::int64_t positiveMs(const json& v, const char* key) {
      auto ms = v.get<std::int64_t>();
      if (ms <= 0)
        throw std::invalid_argument(std::string("[AgentConfig] '") + key + "' must be > 0");
      return ms;
    }

    std::uint16_t parsePort(const std::string& text, const char* source) {
      char* end = nullptr;
      long v = std::strtol(text.c_str(), &end, 10);
      if (text.empty() || *end != '\0' || v < 1 || v > 65535)
        throw std::invalid_argument(std::string("[AgentConfig] invalid port from ") + source + ": " + text);
      return static_cast<std::uint16_t>(v);
    }
  } // namespace

  std::optional<std::string> processEnv(const char* name) {
    const char* v = std::getenv(name);
    if (!v)
      return std::nullopt;
    return std::string(v);
  }

  bool parseBoolFlag(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "true";
  }

  void AgentConfig::applyJson(const json& doc) {
    if (!doc.is_object())
      throw std::invalid_argument("[AgentConfig] config must be a JSON object");

    auto isString = [](const json& v) { return v.is_string(); };
    auto isInt = [](const json& v) { return v.is_number_integer(); };
    auto isBool = [](const json& v) { return v.is_boolean(); };
    auto isStringArray = [](const json& v) {
      return v.is_array() && std::all_of(v.begin(), v.end(), [](const json& e) { return e.is_string(); });
    };

    if (auto v = field(doc, "host", isString, "a string"))
      host = v->get<std::string>();
    if (auto v = field(doc, "port", isInt, "an integer")) {
      auto p = v->get<std::int64_t>();
      if (p < 1 || p > 65535)
        throw std::invalid_argument("[AgentConfig] 'port' out of range: " + std::to_string(p));
      port = static_cast<std::uint16_t>(p);
    }
    if (auto v = field(doc, "debug", isBool, "a boolean"))
      debug = v->get<bool>();
    if (auto v = field(doc, "processName", isString, "a string"))
      probe.processName = v->get<std::string>();
    if (auto v = field(doc, "statusFile", isString, "a string"))
      probe.statusFile = v->get<std::string>();
    if (auto v = field(doc, "procRoot", isString, "a string"))
      probe.procRoot = v->get<std::string>();
    if (auto v = field(doc, "programExtensions", isStringArray, "an array of strings"))
      probe.programExtensions = v->get<std::vector<std::string>>();
    if (auto v = field(doc, "reconcileIntervalMs", isInt, "an integer"))
      reconcileInterval = std::chrono::milliseconds{ positiveMs(*v, "reconcileIntervalMs") };
    if (auto v = field(doc, "probeTimeoutMs", isInt, "an integer"))
      probeTimeout = std::chrono::milliseconds{ positiveMs(*v, "probeTimeoutMs") };
    if (auto v = field(doc, "logFile", isString, "a string"))
      logFile = v->get<std::string>();
  }

  void AgentConfig::applyEnvironment(
      const std::function<std::optional<std::string>(const char*)>& getenv) {
    if (auto v = getenv("RETRO_AGENT_HOST"))
      host = *v;
    if (auto v = getenv("RETRO_AGENT_PORT"))
      port = parsePort(*v, "RETRO_AGENT_PORT");
    if (auto v = getenv("RETRO_AGENT_DEBUG"))
      debug = parseBoolFlag(*v);
    if (auto v = getenv("RETRO_AGENT_PROCESS"))
      probe.processName = *v;
    if (auto v = getenv("RETRO_AGENT_STATUS_FILE"))
      probe.statusFile = *v;
  }

  void AgentConfig::validate() const {
    if (host.empty())
      throw std::invalid_argument("[AgentConfig] host must not be empty");
    if (port == 0)
      throw std::invalid_argument("[AgentConfig] port must be in 1..65535");
    if (probe.processName.empty())
      throw std::invalid_argument("[AgentConfig] processName must not be empty");
    if (probe.procRoot.empty())
      throw std::invalid_argument("[AgentConfig] procRoot must not be empty");
    if (reconcileInterval.count() <= 0 || probeTimeout.count() <= 0)
      throw std::invalid_argument("[AgentConfig] intervals must be positive");
  }

} // namespace retro::core
