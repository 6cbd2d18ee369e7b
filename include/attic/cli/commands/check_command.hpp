#pragma once

#include <cstdint>
#include <string>

#include <CLI/CLI.hpp>

#include "attic/cli/application.hpp"

namespace attic::cli {

class CheckCommand : public Command {
 public:
  explicit CheckCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "check"; }
  std::string description() const override { return "Run the archival policy checks on a file"; }
  void setupCommand(CLI::App* cmd) override;
  bool needsServices() const override { return false; }

 private:
  Application& app_;

  std::string file_;
  std::uint64_t size_limit_ = 0;
  bool do_not_archive_ = false;
};

}  // namespace attic::cli
