#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "attic/cli/application.hpp"

namespace attic::cli {

class ServeCommand : public Command {
 public:
  explicit ServeCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "serve"; }
  std::string description() const override { return "Run the HTTP archival service"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;

  std::string bind_;
  int port_ = 0;
};

}  // namespace attic::cli
