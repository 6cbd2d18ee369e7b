#include "attic/cli/commands/serve_command.hpp"

#include <memory>

#include <spdlog/spdlog.h>

#include "attic/server/api_handler.hpp"
#include "attic/server/http_server.hpp"

namespace attic::cli {

ServeCommand::ServeCommand(Application& app) : app_(app) {}

Result<int> ServeCommand::execute(const GlobalOptions& options) {
  (void)options;
  auto& services = app_.services();
  const auto& settings = services.settings;

  server::ApiHandlerOptions handler_options;
  handler_options.api_token = settings.server.api_token;
  handler_options.staging_dir = settings.staging_dir;
  handler_options.max_body_bytes = settings.server.max_body_bytes;
  auto handler = std::make_shared<server::ApiHandler>(services.archiver, handler_options);

  server::HttpServerOptions server_options;
  server_options.bind = bind_.empty() ? settings.server.bind : bind_;
  server_options.port = static_cast<unsigned short>(port_ > 0 ? port_ : settings.server.port);
  server_options.max_body_bytes = settings.server.max_body_bytes;
  server_options.api_token = settings.server.api_token;

  if (!services.archiver->enabled()) {
    spdlog::warn("Archiver is disabled; POST /archive will answer 503");
  }

  server::HttpServer http(handler, server_options);
  auto result = http.run();
  if (!result) {
    return std::unexpected(result.error());
  }
  spdlog::info("Server stopped");
  return 0;
}

void ServeCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--bind", bind_, "Listen address (overrides server.bind)");
  cmd->add_option("--port", port_, "Listen port (overrides server.port)")->check(CLI::Range(1, 65535));
}

}  // namespace attic::cli
