#include "attic/cli/commands/rehydrate_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "attic/archive/content_hasher.hpp"

namespace attic::cli {

RehydrateCommand::RehydrateCommand(Application& app) : app_(app) {}

Result<int> RehydrateCommand::execute(const GlobalOptions& options) {
  if (!archive::ContentHasher::isValidHash(content_hash_)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Not a SHA-256 content hash: " + content_hash_));
  }

  auto link = app_.services().archiver->rehydrate(content_hash_);
  if (!link) {
    return std::unexpected(link.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["content_hash"] = link->content_hash;
    output["url"] = link->url;
    output["filename"] = link->filename;
    std::cout << output.dump(2) << std::endl;
  } else {
    std::cout << link->url << std::endl;
  }
  return 0;
}

void RehydrateCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("hash", content_hash_, "Content hash of an archived file")->required();
}

}  // namespace attic::cli
