#pragma once

#include <cstddef>
#include <string>

#include <CLI/CLI.hpp>

#include "attic/cli/application.hpp"

namespace attic::cli {

class SearchCommand : public Command {
 public:
  explicit SearchCommand(Application& app);

  Result<int> execute(const GlobalOptions& options) override;
  std::string name() const override { return "search"; }
  std::string description() const override { return "Search archived files by tag substring"; }
  void setupCommand(CLI::App* cmd) override;

 private:
  Application& app_;

  std::string tag_;
  std::size_t limit_ = 50;
  std::size_t offset_ = 0;
};

}  // namespace attic::cli
