#include "attic/cli/commands/tag_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "attic/archive/content_hasher.hpp"

namespace attic::cli {

TagCommand::TagCommand(Application& app) : app_(app) {}

Result<int> TagCommand::execute(const GlobalOptions& options) {
  if (!archive::ContentHasher::isValidHash(content_hash_)) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Not a SHA-256 content hash: " + content_hash_));
  }

  auto record = app_.services().archiver->updateTags(content_hash_, tags_);
  if (!record) {
    return std::unexpected(record.error());
  }

  if (options.json) {
    std::cout << archive::recordToJson(*record).dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Tags for " << record->filename << ": ";
    if (record->tags.empty()) {
      std::cout << "(none)";
    }
    for (std::size_t i = 0; i < record->tags.size(); ++i) {
      std::cout << (i == 0 ? "" : ", ") << record->tags[i];
    }
    std::cout << std::endl;
  }
  return 0;
}

void TagCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("hash", content_hash_, "Content hash of an archived file")->required();
  cmd->add_option("--set", tags_, "New tag list (replaces existing tags)")->delimiter(',');
}

}  // namespace attic::cli
