#pragma once
/** @file  Router.hpp
 *  @brief Maps (method, path, body) onto Supervisor calls. No sockets in here.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "core/EmulatorState.hpp"

namespace retro {
  namespace core {
    class Supervisor;
    class Logger;
  } // namespace core
  namespace io {
    class SystemMonitor;
  } // namespace io

  namespace api {

    struct Reply {
      int status{ 200 };
      nlohmann::json body;
    };

    /**
 * @class Router
 * @brief Transport-free HTTP boundary.
 *
 *  * GET /status, POST /status/refresh, POST /dev/mode, POST /dev/state.
 *  * AgentError{InvalidInput} → 400, AgentError{InvalidOperation} → 409,
 *    unknown path → 404, wrong method → 405.
 *  * Successful calls always answer with the resulting snapshot.
 */
    class Router {
    public:
      Router(std::shared_ptr<core::Supervisor> supervisor,
             std::shared_ptr<io::SystemMonitor> monitor, std::shared_ptr<core::Logger> logger);

      Reply handle(const std::string& method, const std::string& path, const std::string& body);

    private:
      Reply dispatch(const std::string& method, const std::string& path, const std::string& body);
      Reply getStatus();
      Reply postRefresh();
      Reply postMode(const std::string& body);
      Reply postDevState(const std::string& body);
      Reply snapshotReply(const core::EmulatorState& state);

      std::shared_ptr<core::Supervisor> supervisor_;
      std::shared_ptr<io::SystemMonitor> monitor_; ///< may be null → systemStats = {}, process = null
      std::shared_ptr<core::Logger> log_;
    };

  } // namespace api
} // namespace retro
