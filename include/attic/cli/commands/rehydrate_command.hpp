#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "attic/cli/application.hpp"

namespace attic::cli {

class RehydrateCommand : public Command {
 public:
  explicit RehydrateCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "rehydrate"; }
  std::string description() const override { return "Resolve a content hash to a fresh download URL"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;

  std::string content_hash_;
};

}  // namespace attic::cli
