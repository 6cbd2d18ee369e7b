#include "attic/common.hpp"

#include <sstream>

namespace attic {

std::string_view errorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kFileNotFound:
      return "File not found";
    case ErrorCode::kFileReadError:
      return "File read error";
    case ErrorCode::kFileWriteError:
      return "File write error";
    case ErrorCode::kDirectoryCreateError:
      return "Directory create error";
    case ErrorCode::kParseError:
      return "Parse error";
    case ErrorCode::kValidationError:
      return "Validation error";
    case ErrorCode::kDatabaseError:
      return "Database error";
    case ErrorCode::kNetworkError:
      return "Network error";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kConfigError:
      return "Configuration error";
    case ErrorCode::kArchiverDisabled:
      return "Archiver disabled";
    case ErrorCode::kPolicyDenied:
      return "Policy denied";
    case ErrorCode::kSizeLimitUncompressible:
      return "Size limit uncompressible";
    case ErrorCode::kUploadFailure:
      return "Upload failure";
    case ErrorCode::kAttachmentNotFound:
      return "Attachment not found";
    case ErrorCode::kUnknownError:
      return "Unknown error";
  }
  return "Unknown error";
}

bool isRetryable(ErrorCode code) {
  switch (code) {
    case ErrorCode::kUploadFailure:
    case ErrorCode::kNetworkError:
    case ErrorCode::kDatabaseError:
      return true;
    default:
      return false;
  }
}

std::string Version::toString() const {
  std::ostringstream oss;
  oss << major << "." << minor << "." << patch;
  if (!build.empty()) {
    oss << "+" << build;
  }
  return oss.str();
}

Version getVersion() {
#ifdef ATTIC_VERSION_BUILD
  return Version{0, 3, 0, ATTIC_VERSION_BUILD};
#else
  return Version{0, 3, 0, ""};
#endif
}

}  // namespace attic
