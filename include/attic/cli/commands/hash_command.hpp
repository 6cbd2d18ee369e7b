#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "attic/cli/application.hpp"

namespace attic::cli {

class HashCommand : public Command {
 public:
  explicit HashCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "hash"; }
  std::string description() const override { return "Print the SHA-256 content hash of a file"; }
  void setupCommand(CLI::App* cmd) override;
  bool needsServices() const override { return false; }

 private:
  Application& app_;

  std::string file_;
};

}  // namespace attic::cli
