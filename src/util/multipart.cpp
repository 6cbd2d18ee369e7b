#include "attic/util/multipart.hpp"

#include <algorithm>
#include <cctype>

namespace attic::util {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t");
  return value.substr(begin, end - begin + 1);
}

// Value of `key=...` inside a header parameter list; handles quoted values
std::optional<std::string> headerParam(const std::string& header, const std::string& key) {
  std::string lowered = toLower(header);
  std::string needle = key + "=";

  size_t pos = 0;
  while ((pos = lowered.find(needle, pos)) != std::string::npos) {
    // Must start a parameter, not be the tail of another name (name= vs filename=)
    bool at_boundary = pos == 0 || lowered[pos - 1] == ';' || lowered[pos - 1] == ' ' ||
                       lowered[pos - 1] == '\t';
    if (!at_boundary) {
      pos += needle.size();
      continue;
    }

    size_t value_start = pos + needle.size();
    if (value_start < header.size() && header[value_start] == '"') {
      size_t value_end = header.find('"', value_start + 1);
      if (value_end == std::string::npos) {
        return std::nullopt;
      }
      return header.substr(value_start + 1, value_end - value_start - 1);
    }

    size_t value_end = header.find(';', value_start);
    return trim(header.substr(value_start, value_end == std::string::npos
                                               ? std::string::npos
                                               : value_end - value_start));
  }
  return std::nullopt;
}

}  // namespace

Result<std::string> multipartBoundary(const std::string& content_type) {
  if (toLower(content_type).rfind("multipart/form-data", 0) != 0) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Expected multipart/form-data, got: " + content_type));
  }

  auto boundary = headerParam(content_type, "boundary");
  if (!boundary.has_value() || boundary->empty()) {
    return std::unexpected(makeError(ErrorCode::kInvalidArgument,
                                     "Missing multipart boundary"));
  }
  return *boundary;
}

Result<std::vector<FormPart>> parseMultipart(const std::string& body, const std::string& boundary) {
  const std::string delimiter = "--" + boundary;
  const std::string part_end = "\r\n" + delimiter;

  size_t pos = body.find(delimiter);
  if (pos == std::string::npos) {
    return std::unexpected(makeError(ErrorCode::kParseError, "Multipart boundary not found"));
  }
  pos += delimiter.size();

  std::vector<FormPart> parts;
  while (true) {
    if (body.compare(pos, 2, "--") == 0) {
      break;  // closing delimiter
    }
    if (body.compare(pos, 2, "\r\n") != 0) {
      return std::unexpected(makeError(ErrorCode::kParseError, "Malformed multipart delimiter"));
    }
    pos += 2;

    size_t headers_end = body.find("\r\n\r\n", pos);
    if (headers_end == std::string::npos) {
      return std::unexpected(makeError(ErrorCode::kParseError, "Unterminated multipart headers"));
    }

    FormPart part;
    size_t line_start = pos;
    while (line_start < headers_end) {
      size_t line_end = body.find("\r\n", line_start);
      if (line_end == std::string::npos || line_end > headers_end) {
        line_end = headers_end;
      }
      std::string line = body.substr(line_start, line_end - line_start);
      line_start = line_end + 2;

      auto colon = line.find(':');
      if (colon == std::string::npos) {
        continue;
      }
      std::string name = toLower(trim(line.substr(0, colon)));
      std::string value = trim(line.substr(colon + 1));

      if (name == "content-disposition") {
        if (auto field = headerParam(value, "name")) {
          part.name = *field;
        }
        part.filename = headerParam(value, "filename");
      } else if (name == "content-type") {
        part.content_type = value;
      }
    }

    size_t body_start = headers_end + 4;
    size_t body_end = body.find(part_end, body_start);
    if (body_end == std::string::npos) {
      return std::unexpected(makeError(ErrorCode::kParseError, "Unterminated multipart part"));
    }

    part.body = body.substr(body_start, body_end - body_start);
    if (part.name.empty()) {
      return std::unexpected(makeError(ErrorCode::kParseError, "Multipart part without a name"));
    }
    parts.push_back(std::move(part));

    pos = body_end + part_end.size();
  }

  return parts;
}

const FormPart* findPart(const std::vector<FormPart>& parts, const std::string& name) {
  auto it = std::find_if(parts.begin(), parts.end(),
                         [&name](const FormPart& part) { return part.name == name; });
  return it == parts.end() ? nullptr : &*it;
}

}  // namespace attic::util
