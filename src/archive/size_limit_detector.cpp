#include "attic/archive/size_limit_detector.hpp"

#include <cctype>
#include <charconv>

#include <spdlog/spdlog.h>

namespace attic::archive {

std::string SizeLimitDetector::targetVariable(const std::string& target_id, bool use_bot) {
  std::string name = "ARCHIVER_LIMIT_";
  for (unsigned char c : target_id) {
    name.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
  }
  name += use_bot ? "_BOT" : "_WEBHOOK";
  return name;
}

std::optional<std::uint64_t> SizeLimitDetector::readLimit(const std::string& name) const {
  auto raw = env_.get(name);
  if (!raw.has_value() || raw->empty()) {
    return std::nullopt;
  }

  std::uint64_t value = 0;
  const char* begin = raw->data();
  const char* end = raw->data() + raw->size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end || value == 0) {
    spdlog::warn("Ignoring {}={}: expected a positive byte count", name, *raw);
    return std::nullopt;
  }
  return value;
}

std::uint64_t SizeLimitDetector::detect(const std::optional<std::string>& target_id,
                                        bool use_bot) const {
  if (target_id.has_value() && !target_id->empty()) {
    if (auto limit = readLimit(targetVariable(*target_id, use_bot))) {
      return *limit;
    }
  }

  if (!use_bot) {
    if (auto limit = readLimit("ARCHIVER_WEBHOOK_LIMIT_BYTES")) {
      return *limit;
    }
  }

  if (auto limit = readLimit("ARCHIVER_LIMIT_BYTES")) {
    return *limit;
  }

  return kDefaultLimitBytes;
}

}  // namespace attic::archive
