#include "attic/cli/commands/route_command.hpp"

#include <iostream>
#include <optional>

#include <nlohmann/json.hpp>

namespace attic::cli {

RouteCommand::RouteCommand(Application& app) : app_(app) {}

Result<int> RouteCommand::execute(const GlobalOptions& options) {
  const auto& router = *app_.services().router;

  std::optional<std::string> tenant;
  if (!tenant_.empty()) {
    tenant = tenant_;
  }

  auto kind = router.kindFromPath(file_);
  auto route = router.pickChannel(file_, tenant, visibility_);
  if (!route) {
    return std::unexpected(route.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["media_type"] = archive::mediaKindToString(kind);
    output["visibility"] = visibility_;
    output["channel_id"] = route->channel_id;
    output["thread_id"] = route->thread_id ? nlohmann::json(*route->thread_id) : nlohmann::json();
    output["has_webhook"] = route->webhook_url.has_value();
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  std::cout << archive::mediaKindToString(kind) << "/" << visibility_ << " -> "
            << route->channel_id;
  if (route->thread_id) {
    std::cout << " (thread " << *route->thread_id << ")";
  }
  std::cout << std::endl;
  return 0;
}

void RouteCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "File name or path to route")->required();
  cmd->add_option("--tenant", tenant_, "Tenant for route overrides");
  cmd->add_option("--visibility", visibility_, "Route visibility")
      ->check(CLI::IsMember({"public", "private"}));
}

}  // namespace attic::cli
