#pragma once

#include <optional>
#include <string>
#include <vector>

#include "attic/common.hpp"

namespace attic::util {

// One decoded part of a multipart/form-data body
struct FormPart {
  std::string name;
  std::optional<std::string> filename;
  std::string content_type;
  std::string body;
};

// Extract the boundary parameter from a multipart/form-data Content-Type value
Result<std::string> multipartBoundary(const std::string& content_type);

// Split a multipart/form-data body into its parts (RFC 7578)
Result<std::vector<FormPart>> parseMultipart(const std::string& body, const std::string& boundary);

// First part with the given field name, if any
const FormPart* findPart(const std::vector<FormPart>& parts, const std::string& name);

}  // namespace attic::util
