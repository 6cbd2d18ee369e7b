#include "attic/server/http_server.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <mutex>
#include <thread>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>

namespace attic::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

std::string toStdString(beast::string_view view) {
  return std::string(view.data(), view.size());
}

ApiRequest toApiRequest(http::request<http::string_body>& req) {
  ApiRequest request;
  request.method = toStdString(req.method_string());
  request.target = toStdString(req.target());
  for (const auto& field : req) {
    std::string name = toStdString(field.name_string());
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    request.headers[name] = toStdString(field.value());
  }
  request.body = std::move(req.body());
  return request;
}

void writeResponse(tcp::socket& socket, const ApiResponse& result, unsigned version,
                   bool keep_alive, beast::error_code& ec) {
  http::response<http::string_body> res{static_cast<http::status>(result.status), version};
  res.set(http::field::server, "attic/" + getVersion().toString());
  res.set(http::field::content_type, result.content_type);
  res.keep_alive(keep_alive);
  res.body() = result.body;
  res.prepare_payload();
  http::write(socket, res, ec);
}

// One connection, served synchronously on its own thread
void serveConnection(std::shared_ptr<tcp::socket> connection, std::shared_ptr<ApiHandler> handler,
                     std::uint64_t max_body_bytes, std::shared_ptr<std::atomic<bool>> finished) {
  tcp::socket& socket = *connection;
  beast::error_code ec;
  beast::flat_buffer buffer;

  for (;;) {
    http::request_parser<http::string_body> parser;
    parser.body_limit(max_body_bytes);
    http::read(socket, buffer, parser, ec);

    if (ec == http::error::end_of_stream) {
      break;
    }
    if (ec == http::error::body_limit) {
      Error error(ErrorCode::kInvalidArgument,
                  "Request body exceeds " + std::to_string(max_body_bytes) + " bytes");
      ApiResponse too_large{413, "application/json", ApiHandler::errorBody(error).dump()};
      writeResponse(socket, too_large, 11, false, ec);
      break;
    }
    if (ec) {
      spdlog::debug("Connection read failed: {}", ec.message());
      break;
    }

    auto& req = parser.get();
    unsigned version = req.version();
    bool keep_alive = req.keep_alive();

    ApiResponse result;
    try {
      result = handler->handle(toApiRequest(req));
    } catch (const std::exception& e) {
      spdlog::error("Unhandled error serving request: {}", e.what());
      result = ApiHandler::errorResponse(makeError(ErrorCode::kUnknownError, e.what()));
    }

    writeResponse(socket, result, version, keep_alive, ec);
    if (ec) {
      spdlog::debug("Connection write failed: {}", ec.message());
      break;
    }
    if (!keep_alive) {
      break;
    }
  }

  socket.shutdown(tcp::socket::shutdown_send, ec);
  *finished = true;
}

struct Connection {
  std::thread worker;
  std::shared_ptr<tcp::socket> socket;
  std::shared_ptr<std::atomic<bool>> finished;
};

}  // namespace

struct HttpServer::Impl {
  std::shared_ptr<ApiHandler> handler;
  HttpServerOptions options;
  net::io_context ioc{1};
  std::unique_ptr<tcp::acceptor> acceptor;
  std::atomic<bool> stopping{false};
  std::atomic<unsigned short> bound_port{0};

  std::mutex connections_mutex;
  std::vector<Connection> connections;

  void startConnection(tcp::socket socket) {
    auto shared = std::make_shared<tcp::socket>(std::move(socket));
    auto finished = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(connections_mutex);
    reapFinished();
    connections.push_back(Connection{
        std::thread(serveConnection, shared, handler, options.max_body_bytes, finished), shared,
        finished});
  }

  // Caller holds connections_mutex
  void reapFinished() {
    for (auto it = connections.begin(); it != connections.end();) {
      if (it->finished->load()) {
        it->worker.join();
        it = connections.erase(it);
      } else {
        ++it;
      }
    }
  }

  // Idle keep-alive reads end at once; a request already read still gets its response
  void joinConnections() {
    std::vector<Connection> pending;
    {
      std::lock_guard<std::mutex> lock(connections_mutex);
      pending.swap(connections);
    }
    if (!pending.empty()) {
      spdlog::info("Waiting for {} open connection(s)", pending.size());
    }
    for (auto& connection : pending) {
      beast::error_code ignored;
      connection.socket->shutdown(tcp::socket::shutdown_receive, ignored);
    }
    for (auto& connection : pending) {
      if (connection.worker.joinable()) {
        connection.worker.join();
      }
    }
  }

  void doAccept() {
    acceptor->async_accept([this](beast::error_code ec, tcp::socket socket) {
      if (stopping) {
        return;
      }
      if (ec) {
        spdlog::warn("Accept failed: {}", ec.message());
      } else {
        startConnection(std::move(socket));
      }
      doAccept();
    });
  }
};

HttpServer::HttpServer(std::shared_ptr<ApiHandler> handler, HttpServerOptions options)
    : pImpl(std::make_unique<Impl>()) {
  pImpl->handler = std::move(handler);
  pImpl->options = std::move(options);
}

HttpServer::~HttpServer() {
  stop();
  if (pImpl) {
    pImpl->joinConnections();
  }
}

Result<void> HttpServer::run() {
  if (pImpl->options.api_token.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Refusing to serve without an API token (ARCHIVER_API_TOKEN)"));
  }

  try {
    auto address = net::ip::make_address(pImpl->options.bind);
    pImpl->acceptor = std::make_unique<tcp::acceptor>(
        pImpl->ioc, tcp::endpoint{address, pImpl->options.port});
    pImpl->bound_port = pImpl->acceptor->local_endpoint().port();

    net::signal_set signals(pImpl->ioc, SIGINT, SIGTERM);
    signals.async_wait([this](const beast::error_code& ec, int signal_number) {
      if (!ec) {
        spdlog::info("Received signal {}, shutting down", signal_number);
        stop();
      }
    });

    spdlog::info("Listening on {}:{}", pImpl->options.bind, pImpl->bound_port.load());
    pImpl->doAccept();
    pImpl->ioc.run();
  } catch (const boost::system::system_error& e) {
    pImpl->joinConnections();
    return std::unexpected(makeError(ErrorCode::kNetworkError,
                                     "HTTP server failed: " + std::string(e.what())));
  }

  pImpl->joinConnections();
  return {};
}

unsigned short HttpServer::port() const {
  return pImpl ? pImpl->bound_port.load() : 0;
}

void HttpServer::stop() {
  if (!pImpl) {
    return;
  }
  pImpl->stopping = true;
  pImpl->ioc.stop();
}

}  // namespace attic::server
