#include "attic/cli/commands/stats_command.hpp"

#include <iostream>

namespace attic::cli {

StatsCommand::StatsCommand(Application& app) : app_(app) {}

Result<int> StatsCommand::execute(const GlobalOptions& options) {
  auto stats = app_.services().archiver->stats();
  if (!stats) {
    return std::unexpected(stats.error());
  }

  if (options.json) {
    std::cout << archive::statsToJson(*stats).dump(2) << std::endl;
    return 0;
  }

  std::cout << "Records:     " << stats->records << std::endl;
  std::cout << "Total bytes: " << stats->total_bytes << std::endl;
  for (const auto& [media_type, count] : stats->by_media_type) {
    std::cout << "  " << media_type << ": " << count << std::endl;
  }
  return 0;
}

}  // namespace attic::cli
