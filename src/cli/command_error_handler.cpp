#include "attic/cli/command_error_handler.hpp"

#include <iostream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "attic/server/api_handler.hpp"

namespace attic::cli {

int exitCodeFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return kExitOk;
    case ErrorCode::kPolicyDenied:
      return kExitPolicyDenied;
    case ErrorCode::kNotFound:
    case ErrorCode::kAttachmentNotFound:
    case ErrorCode::kFileNotFound:
      return kExitNotFound;
    case ErrorCode::kConfigError:
    case ErrorCode::kArchiverDisabled:
      return kExitConfig;
    default:
      return kExitError;
  }
}

int CommandErrorHandler::handleError(const Error& error, const std::string& operation) {
  if (operation.empty()) {
    spdlog::debug("Command failed: {}", error.message());
  } else {
    spdlog::debug("{} failed: {}", operation, error.message());
  }

  if (options_.json) {
    // Same shape the HTTP façade returns
    std::cout << server::ApiHandler::errorBody(error).dump() << std::endl;
  } else {
    std::cerr << "Error: " << error.message() << std::endl;
    for (const auto& reason : error.details()) {
      std::cerr << "  - " << reason << std::endl;
    }
    if (isRetryable(error.code()) && !options_.quiet) {
      std::cerr << "(retryable)" << std::endl;
    }
  }

  return exitCodeFor(error.code());
}

void CommandErrorHandler::displaySuccess(const std::string& message) {
  if (options_.quiet) {
    return;
  }
  if (options_.json) {
    nlohmann::json success_json;
    success_json["success"] = true;
    success_json["message"] = message;
    std::cout << success_json.dump() << std::endl;
  } else {
    std::cout << "\033[32m✓\033[0m " << message << std::endl;
  }
}

void CommandErrorHandler::displayWarning(const std::string& message) {
  if (options_.json) {
    nlohmann::json warning_json;
    warning_json["warning"] = true;
    warning_json["message"] = message;
    std::cout << warning_json.dump() << std::endl;
  } else {
    std::cerr << "\033[33m⚠\033[0m " << message << std::endl;
  }
}

void CommandErrorHandler::displayInfo(const std::string& message) {
  if (options_.quiet) {
    return;
  }
  if (options_.json) {
    nlohmann::json info_json;
    info_json["info"] = true;
    info_json["message"] = message;
    std::cout << info_json.dump() << std::endl;
  } else {
    std::cout << message << std::endl;
  }
}

}  // namespace attic::cli
