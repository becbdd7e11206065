/* @file main.cpp
 * @brief retro-agent entry point: config → logger → supervisor → HTTP, then wait for a signal
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstring>
#include <stdexcept>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

// Linux headers
#include <signal.h>

// RetroAgent headers
#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "core/AgentConfig.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/Supervisor.hpp"
#include "io/FileLogger.hpp"
#include "io/ProcessProbe.hpp"
#include "io/SimulatedBackend.hpp"
#include "io/SystemMonitor.hpp"
#include "io/TimedBackend.hpp"

#include <nlohmann/json.hpp>

using namespace retro;

namespace {

  void printUsage(const char* argv0) {
    std::cout << "usage: " << argv0 << " [--config <file.json>]\n"
              << "env: RETRO_AGENT_CONFIG RETRO_AGENT_HOST RETRO_AGENT_PORT RETRO_AGENT_DEBUG\n"
              << "     RETRO_AGENT_PROCESS RETRO_AGENT_STATUS_FILE\n";
  }

  core::AgentConfig buildConfig(int argc, char** argv) {
    std::optional<std::string> configPath = core::processEnv("RETRO_AGENT_CONFIG");
    for (int i = 1; i < argc; ++i) {
      if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
        configPath = argv[++i];
      } else {
        throw std::invalid_argument(std::string("[main] unknown argument: ") + argv[i]);
      }
    }

    core::AgentConfig cfg;
    if (configPath && !configPath->empty())
      cfg.applyJson(core::ConfigLoader(*configPath).load());
    cfg.applyEnvironment(core::processEnv);
    cfg.validate();
    return cfg;
  }

} // namespace

int main(int argc, char** argv) {
  if (argc > 1 && (std::strcmp(argv[1], "--help") == 0 || std::strcmp(argv[1], "-h") == 0)) {
    printUsage(argv[0]);
    return 0;
  }

  // block before any thread starts so only sigwait() below sees them
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  try {
    const core::AgentConfig cfg = buildConfig(argc, argv);

    auto logger = std::make_shared<core::Logger>(cfg.debug ? core::LogLevel::Debug : core::LogLevel::Info);
    core::Logger::setThreadName("main");
    logger->start();
    if (!cfg.logFile.empty()) {
      auto file = std::make_unique<io::FileLogger>();
      if (file->open(cfg.logFile))
        logger->attachFile(std::move(file));
      else
        logger->warn("main", "cannot open log file " + cfg.logFile + ", logging to stderr only");
    }

    auto errorMonitor = std::make_shared<core::ErrorMonitor>();
    errorMonitor->registerEscalation(
        [logger](const std::string& msg) { logger->error("ErrorMonitor", msg); });

    auto probe = std::make_shared<io::ProcessProbe>(cfg.probe);
    auto real = std::make_shared<io::TimedBackend>(probe, cfg.probeTimeout);
    auto sim = std::make_shared<io::SimulatedBackend>();

    auto supervisor =
        std::make_shared<core::Supervisor>(real, sim, errorMonitor, logger, cfg.reconcileInterval);
    auto router = std::make_shared<api::Router>(supervisor, std::make_shared<io::SystemMonitor>(), logger);
    api::HttpServer server(router, logger);

    logger->info("main", "watching process '" + cfg.probe.processName + "'" +
                             (cfg.probe.statusFile.empty() ? "" : ", status file " + cfg.probe.statusFile));
    supervisor->reconcile(); // first snapshot exists before anyone can ask for it
    supervisor->start();
    server.start(cfg.host, cfg.port);

    int sig = 0;
    sigwait(&signals, &sig);
    logger->info("main", std::string("caught ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") + ", shutting down");

    server.stop();
    supervisor->stop();
    logger->stop();
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
