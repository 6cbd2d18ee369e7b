#include "attic/cli/commands/archive_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "attic/util/time.hpp"

namespace attic::cli {

ArchiveCommand::ArchiveCommand(Application& app) : app_(app) {}

Result<int> ArchiveCommand::execute(const GlobalOptions& options) {
  archive::ArchiveMeta meta;
  meta.tags = tags_;
  if (!tenant_.empty()) {
    meta.tenant = tenant_;
  }
  if (!workspace_.empty()) {
    meta.workspace = workspace_;
  }
  meta.visibility = visibility_;
  if (size_limit_ > 0) {
    meta.size_limit = size_limit_;
  }
  // Local files stay put unless the caller asks otherwise
  meta.keep_original = !delete_source_;

  auto outcome = app_.services().archiver->archiveFile(file_, meta);
  if (!outcome) {
    return std::unexpected(outcome.error());
  }

  const auto& record = outcome->record;
  if (options.json) {
    nlohmann::json output = archive::recordToJson(record);
    output["cache_hit"] = outcome->cache_hit;
    if (outcome->quality.has_value()) {
      output["quality"] = *outcome->quality;
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  if (options.quiet) {
    std::cout << record.content_hash << std::endl;
    return 0;
  }

  std::cout << (outcome->cache_hit ? "Already archived: " : "Archived: ") << record.filename
            << std::endl;
  std::cout << "  hash:     " << record.content_hash << std::endl;
  std::cout << "  channel:  " << record.channel_id << std::endl;
  std::cout << "  message:  " << record.message_id << std::endl;
  std::cout << "  size:     " << record.size << " bytes";
  if (record.compression.final_size != record.compression.original_size) {
    std::cout << " (from " << record.compression.original_size << ")";
  }
  std::cout << std::endl;
  if (outcome->quality.has_value()) {
    std::cout << "  quality:  " << *outcome->quality << std::endl;
  }
  std::cout << "  created:  " << util::Time::toRfc3339(record.created_at) << std::endl;
  return 0;
}

void ArchiveCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("file", file_, "File to archive")->required()->check(CLI::ExistingFile);
  cmd->add_option("-t,--tag", tags_, "Tag to attach (repeatable)");
  cmd->add_option("--tenant", tenant_, "Tenant for route overrides");
  cmd->add_option("--workspace", workspace_, "Workspace label stored with the record");
  cmd->add_option("--visibility", visibility_, "Route visibility")
      ->check(CLI::IsMember({"public", "private"}));
  cmd->add_option("--size-limit", size_limit_, "Policy size ceiling in bytes");
  cmd->add_flag("--delete-source", delete_source_, "Remove the source file after archiving");
}

}  // namespace attic::cli
