#include "attic/cli/commands/search_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

#include "attic/util/time.hpp"

namespace attic::cli {

SearchCommand::SearchCommand(Application& app) : app_(app) {}

Result<int> SearchCommand::execute(const GlobalOptions& options) {
  auto results = app_.services().archiver->searchTag(tag_, limit_, offset_);
  if (!results) {
    return std::unexpected(results.error());
  }

  if (options.json) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& summary : *results) {
      items.push_back(archive::summaryToJson(summary));
    }
    nlohmann::json output;
    output["results"] = items;
    output["limit"] = limit_;
    output["offset"] = offset_;
    std::cout << output.dump(2) << std::endl;
    return 0;
  }

  if (results->empty()) {
    if (!options.quiet) {
      std::cout << "No archived files tagged like '" << tag_ << "'" << std::endl;
    }
    return 0;
  }

  for (const auto& summary : *results) {
    std::cout << summary.content_hash.substr(0, 12) << "  " << std::left << std::setw(8)
              << summary.media_type << std::setw(30) << summary.filename << " ";
    for (std::size_t i = 0; i < summary.tags.size(); ++i) {
      std::cout << (i == 0 ? "" : ",") << summary.tags[i];
    }
    std::cout << "  " << util::Time::toRfc3339(summary.created_at) << std::endl;
  }
  return 0;
}

void SearchCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("-t,--tag", tag_, "Tag substring to match")->required();
  cmd->add_option("--limit", limit_, "Maximum results")->check(CLI::Range(1, 500));
  cmd->add_option("--offset", offset_, "Results to skip");
}

}  // namespace attic::cli
