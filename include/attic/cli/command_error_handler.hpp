#pragma once

#include <string>

#include "attic/cli/application.hpp"
#include "attic/common.hpp"

namespace attic::cli {

// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitPolicyDenied = 2;
constexpr int kExitNotFound = 3;
constexpr int kExitConfig = 4;

int exitCodeFor(ErrorCode code);

// Formats command errors for terminal or --json output
class CommandErrorHandler {
 public:
  explicit CommandErrorHandler(const GlobalOptions& options) : options_(options) {}

  // Print the error (with policy reasons) and return the exit code
  int handleError(const Error& error, const std::string& operation = "");

  void displaySuccess(const std::string& message);
  void displayWarning(const std::string& message);
  void displayInfo(const std::string& message);

 private:
  const GlobalOptions& options_;
};

}  // namespace attic::cli
