#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include "attic/archive/route_table.hpp"
#include "attic/archive/sqlite_manifest.hpp"
#include "attic/server/http_server.hpp"
#include "fakes.hpp"
#include "test_helpers.hpp"

namespace attic::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class HttpServerTest : public test::TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();

    auto table = archive::RouteTable::parse("routes:\n  images:\n    public:\n      channel_id: \"c\"\n");
    ASSERT_OK(table);
    auto routes = std::make_shared<const archive::RouteTable>(std::move(*table));

    auto manifest = std::make_shared<archive::SqliteManifest>(temp_dir_ / "manifest.db");
    ASSERT_OK(manifest->initialize());

    archive::ArchiverServices services;
    services.policy = std::make_shared<archive::PolicyEngine>(config::PolicySettings{}, nullptr);
    services.router = std::make_shared<archive::ChannelRouter>(routes);
    services.limits = std::make_shared<archive::SizeLimitDetector>(env_);
    services.compressor = std::make_shared<archive::Compressor>(
        std::make_shared<test::LinearImageCodec>(1), temp_dir_ / "staging");
    services.manifest = manifest;
    services.uploader = std::make_shared<test::RecordingUploader>();
    services.rehydrator =
        std::make_shared<archive::Rehydrator>("https://chat.example.test/api", http_.factory());
    services.cleanup = std::make_shared<archive::CleanupManager>();

    archive::ArchiverOptions options;
    options.enabled = true;
    options.bot_token = "bot";
    auto archiver = std::make_shared<archive::Archiver>(options, std::move(services));

    ApiHandlerOptions handler_options;
    handler_options.api_token = "s3cret";
    handler_options.staging_dir = temp_dir_ / "uploads";
    handler_ = std::make_shared<ApiHandler>(archiver, handler_options);
  }

  static bool waitForPort(const HttpServer& server) {
    for (int i = 0; i < 500 && server.port() == 0; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return server.port() != 0;
  }

  util::MapEnvironment env_;
  test::FakeHttp http_;
  std::shared_ptr<ApiHandler> handler_;
};

TEST_F(HttpServerTest, RefusesToRunWithoutToken) {
  HttpServerOptions options;
  options.port = 0;
  HttpServer server(handler_, options);
  EXPECT_ERROR(server.run(), ErrorCode::kConfigError);
  EXPECT_EQ(server.port(), 0u);
}

TEST_F(HttpServerTest, StopWaitsForOpenKeepAliveConnections) {
  HttpServerOptions options;
  options.port = 0;
  options.api_token = "s3cret";
  HttpServer server(handler_, options);

  Result<void> run_result;
  std::thread runner([&] { run_result = server.run(); });

  if (!waitForPort(server)) {
    server.stop();
    runner.join();
    FAIL() << "server did not start listening";
  }

  net::io_context ioc;
  tcp::socket socket(ioc);
  beast::error_code ec;
  socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), server.port()}, ec);
  EXPECT_FALSE(ec) << ec.message();

  http::request<http::empty_body> req{http::verb::get, "/healthz", 11};
  req.set(http::field::host, "127.0.0.1");
  req.keep_alive(true);
  http::write(socket, req, ec);
  EXPECT_FALSE(ec) << ec.message();

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  http::read(socket, buffer, res, ec);
  EXPECT_FALSE(ec) << ec.message();
  EXPECT_EQ(res.result_int(), 200u);
  auto body = nlohmann::json::parse(res.body(), nullptr, false);
  EXPECT_TRUE(body.is_object() && body.value("status", "") == "ok") << res.body();

  // The connection stays open and idle while the server shuts down
  server.stop();
  runner.join();
  EXPECT_TRUE(run_result.has_value());

  // The server side closed its end once it stopped reading
  http::response<http::string_body> after;
  http::read(socket, buffer, after, ec);
  EXPECT_TRUE(ec);
}

}  // namespace attic::server
