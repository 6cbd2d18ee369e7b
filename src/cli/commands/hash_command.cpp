#include "attic/cli/commands/hash_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "attic/archive/content_hasher.hpp"

namespace attic::cli {

HashCommand::HashCommand(Application& app) : app_(app) {}

Result<int> HashCommand::execute(const GlobalOptions& options) {
  auto hash = archive::ContentHasher::computeHash(file_);
  if (!hash) {
    return std::unexpected(hash.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["file"] = file_;
    output["sha256"] = *hash;
    std::cout << output.dump(2) << std::endl;
  } else {
    std::cout << *hash << "  " << file_ << std::endl;
  }
  return 0;
}

void HashCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "File to hash")->required()->check(CLI::ExistingFile);
}

}  // namespace attic::cli
