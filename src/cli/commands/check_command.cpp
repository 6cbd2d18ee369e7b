#include "attic/cli/commands/check_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "attic/archive/policy_engine.hpp"
#include "attic/cli/command_error_handler.hpp"

namespace attic::cli {

CheckCommand::CheckCommand(Application& app) : app_(app) {}

Result<int> CheckCommand::execute(const GlobalOptions& options) {
  archive::PolicyEngine policy(app_.settings().policy, nullptr);

  archive::ArchiveMeta meta;
  meta.do_not_archive = do_not_archive_;
  if (size_limit_ > 0) {
    meta.size_limit = size_limit_;
  }

  auto decision = policy.check(file_, meta);

  if (options.json) {
    nlohmann::json output;
    output["file"] = file_;
    output["allowed"] = decision.allowed;
    output["reasons"] = decision.reasons;
    std::cout << output.dump(2) << std::endl;
  } else if (decision.allowed) {
    if (!options.quiet) {
      std::cout << "Allowed: " << file_ << std::endl;
    }
  } else {
    std::cout << "Denied: " << file_ << std::endl;
    for (const auto& reason : decision.reasons) {
      std::cout << "  - " << reason << std::endl;
    }
  }
  return decision.allowed ? kExitOk : kExitPolicyDenied;
}

void CheckCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "File to check")->required();
  cmd->add_option("--size-limit", size_limit_, "Policy size ceiling in bytes");
  cmd->add_flag("--do-not-archive", do_not_archive_, "Simulate the do_not_archive flag");
}

}  // namespace attic::cli
