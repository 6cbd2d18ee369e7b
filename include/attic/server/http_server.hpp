#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "attic/common.hpp"
#include "attic/server/api_handler.hpp"

namespace attic::server {

struct HttpServerOptions {
  std::string bind = "127.0.0.1";
  unsigned short port = 8787;  // 0 picks an ephemeral port
  std::uint64_t max_body_bytes = 64ULL * 1024 * 1024;
  std::string api_token;  // Must be non-empty; run() refuses to start otherwise
};

/**
 * @brief Boost.Beast front end for ApiHandler
 *
 * Asio accept loop, one thread per connection. run() joins every
 * connection thread before it returns. The handler must be safe to call
 * concurrently.
 */
class HttpServer {
 public:
  HttpServer(std::shared_ptr<ApiHandler> handler, HttpServerOptions options);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Blocks until stop() is called or the acceptor fails, then drains connections
  Result<void> run();

  // Listening port once run() has bound the acceptor, 0 before
  unsigned short port() const;

  // Safe to call from another thread or a signal watcher
  void stop();

 private:
  struct Impl;
  std::unique_ptr<Impl> pImpl;
};

}  // namespace attic::server
