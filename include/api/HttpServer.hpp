#pragma once
/** @file  HttpServer.hpp
 *  @brief cpp-httplib front end for the Router (runs its own listener thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
  class Server;
} // namespace httplib

namespace retro {
  namespace core {
    class Logger;
  } // namespace core

  namespace api {

    class Router;

    /**
 * @class HttpServer
 * @brief Binds every method/path to Router::handle and serves JSON.
 *
 *  * `start()` binds synchronously (throws std::runtime_error on failure),
 *    then listens on a background thread and returns once it accepts.
 *  * `stop()` is idempotent; the destructor calls it.
 */
    class HttpServer {
    public:
      HttpServer(std::shared_ptr<Router> router, std::shared_ptr<core::Logger> logger);
      ~HttpServer();

      void start(const std::string& host, std::uint16_t port);
      void stop();

      /// Port actually bound (useful when started with port 0).
      int boundPort() const { return boundPort_; }

      HttpServer(const HttpServer&) = delete;
      HttpServer& operator=(const HttpServer&) = delete;

    private:
      void installRoutes();

      std::shared_ptr<Router> router_;
      std::shared_ptr<core::Logger> log_;
      std::unique_ptr<httplib::Server> server_;
      std::thread listener_;
      int boundPort_{ -1 };
    };

  } // namespace api
} // namespace retro
