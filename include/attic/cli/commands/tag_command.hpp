#pragma once

#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "attic/cli/application.hpp"

namespace attic::cli {

class TagCommand : public Command {
 public:
  explicit TagCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "tag"; }
  std::string description() const override { return "Replace the tags of an archived file"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;

  std::string content_hash_;
  std::vector<std::string> tags_;
};

}  // namespace attic::cli
