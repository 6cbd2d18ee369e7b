#include "attic/cli/commands/limits_command.hpp"

#include <iostream>
#include <optional>

#include <nlohmann/json.hpp>

#include "attic/archive/size_limit_detector.hpp"

namespace attic::cli {

LimitsCommand::LimitsCommand(Application& app) : app_(app) {}

Result<int> LimitsCommand::execute(const GlobalOptions& options) {
  archive::SizeLimitDetector detector(app_.environment());

  std::optional<std::string> target;
  if (!target_.empty()) {
    target = target_;
  }
  bool use_bot = !webhook_;
  std::uint64_t limit = detector.detect(target, use_bot);

  if (options.json) {
    nlohmann::json output;
    output["limit_bytes"] = limit;
    output["mode"] = use_bot ? "bot" : "webhook";
    if (target.has_value()) {
      output["target"] = *target;
      output["variable"] = archive::SizeLimitDetector::targetVariable(*target, use_bot);
    }
    std::cout << output.dump(2) << std::endl;
  } else {
    std::cout << limit << std::endl;
    if (target.has_value() && options.verbose > 0) {
      std::cerr << "Override variable: "
                << archive::SizeLimitDetector::targetVariable(*target, use_bot) << std::endl;
    }
  }
  return 0;
}

void LimitsCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("--target", target_, "Channel or thread id");
  cmd->add_flag("--webhook", webhook_, "Resolve the webhook (fallback) limit");
}

}  // namespace attic::cli
