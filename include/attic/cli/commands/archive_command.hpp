#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "attic/cli/application.hpp"

namespace attic::cli {

class ArchiveCommand : public Command {
 public:
  explicit ArchiveCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "archive"; }
  std::string description() const override { return "Archive a file and record it in the manifest"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;

  std::string file_;
  std::vector<std::string> tags_;
  std::string tenant_;
  std::string workspace_;
  std::string visibility_ = "public";
  std::uint64_t size_limit_ = 0;
  bool delete_source_ = false;
};

}  // namespace attic::cli
