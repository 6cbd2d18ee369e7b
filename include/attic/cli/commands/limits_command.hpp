#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "attic/cli/application.hpp"

namespace attic::cli {

class LimitsCommand : public Command {
 public:
  explicit LimitsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "limits"; }
  std::string description() const override { return "Show the effective upload size limit"; }
  void setupCommand(CLI::App* cmd) override;
  bool needsServices() const override { return false; }

 private:
  Application& app_;

  std::string target_;
  bool webhook_ = false;
};

}  // namespace attic::cli
