#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "attic/cli/application.hpp"

namespace attic::cli {

class RouteCommand : public Command {
 public:
  explicit RouteCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "route"; }
  std::string description() const override { return "Show which channel a file would be routed to"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;

  std::string file_;
  std::string tenant_;
  std::string visibility_ = "public";
};

}  // namespace attic::cli
