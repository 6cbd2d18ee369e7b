#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace attic {

// Error handling - using std::expected pattern
enum class ErrorCode {
  kSuccess = 0,
  kInvalidArgument,
  kFileNotFound,
  kFileReadError,
  kFileWriteError,
  kDirectoryCreateError,
  kParseError,
  kValidationError,
  kDatabaseError,
  kNetworkError,
  kNotFound,

  // Archival taxonomy
  kConfigError,
  kArchiverDisabled,
  kPolicyDenied,
  kSizeLimitUncompressible,
  kUploadFailure,
  kAttachmentNotFound,

  kUnknownError
};

// Convert error code to string
std::string_view errorCodeToString(ErrorCode code);

// Whether a caller may reasonably retry the same input later
bool isRetryable(ErrorCode code);

// Error class for detailed error information
class Error {
 public:
  Error(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::vector<std::string> details)
      : code_(code), message_(std::move(message)), details_(std::move(details)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }

  // Structured reasons (policy denials carry one entry per failed check)
  const std::vector<std::string>& details() const { return details_; }

 private:
  ErrorCode code_;
  std::string message_;
  std::vector<std::string> details_;
};

// Result type alias
template <typename T>
using Result = std::expected<T, Error>;

// Convenience function for creating errors
inline Error makeError(ErrorCode code, const std::string& message) {
  return Error(code, message);
}

// Convenience function for creating error results
template<typename T>
inline Result<T> makeErrorResult(ErrorCode code, const std::string& message) {
  return std::unexpected(makeError(code, message));
}

// Version information
struct Version {
  int major;
  int minor;
  int patch;
  std::string build;

  std::string toString() const;
};

// Get version information
Version getVersion();

}  // namespace attic
