/* @file HttpServer.cpp
 * @brief httplib::Server wiring
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <utility>

// 3rd party headers
#include <httplib.h>

// RetroAgent headers
#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "core/Logger.hpp"

using namespace retro::api;

namespace {
  constexpr const char* kTag = "HttpServer";
  constexpr const char* kAnyPath = R"(.*)";
} // namespace

HttpServer::HttpServer(std::shared_ptr<Router> router, std::shared_ptr<core::Logger> logger)
    : router_(std::move(router)), log_(std::move(logger)), server_(std::make_unique<httplib::Server>()) {
  if (!router_)
    throw std::invalid_argument("[HttpServer] router is nullptr");
  if (!log_)
    throw std::invalid_argument("[HttpServer] logger is nullptr");
  installRoutes();
}

HttpServer::~HttpServer() { stop(); }

void HttpServer::installRoutes() {
  // Router owns path matching so 404 and 405 come out the same way as everything else
  auto forward = [router = router_](const httplib::Request& req, httplib::Response& res) {
    Reply reply = router->handle(req.method, req.path, req.body);
    res.status = reply.status;
    res.set_content(reply.body.dump(), "application/json");
  };

  server_->Get(kAnyPath, forward);
  server_->Post(kAnyPath, forward);
  server_->Put(kAnyPath, forward);
  server_->Patch(kAnyPath, forward);
  server_->Delete(kAnyPath, forward);
}

void HttpServer::start(const std::string& host, std::uint16_t port) {
  if (listener_.joinable())
    return;

  if (port == 0) {
    boundPort_ = server_->bind_to_any_port(host);
    if (boundPort_ < 0)
      throw std::runtime_error("[HttpServer] failed to bind " + host + ":<any>");
  } else {
    if (!server_->bind_to_port(host, port))
      throw std::runtime_error("[HttpServer] failed to bind " + host + ":" + std::to_string(port));
    boundPort_ = port;
  }

  log_->info(kTag, "listening on " + host + ":" + std::to_string(boundPort_));
  listener_ = std::thread([this] {
    core::Logger::setThreadName("http");
    if (!server_->listen_after_bind())
      log_->error(kTag, "listener exited with an error");
  });
  // stop() is a no-op until the listener is running, so do not return before it is
  server_->wait_until_ready();
}

void HttpServer::stop() {
  if (!listener_.joinable())
    return;
  server_->stop();
  listener_.join();
  log_->info(kTag, "stopped");
}
