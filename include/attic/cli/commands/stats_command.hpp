#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "attic/cli/application.hpp"

namespace attic::cli {

class StatsCommand : public Command {
 public:
  explicit StatsCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "stats"; }
  std::string description() const override { return "Show manifest totals by media type"; }

 private:
  Application& app_;
};

}  // namespace attic::cli
