#include "attic/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace attic::util {

std::string Time::toRfc3339(std::chrono::system_clock::time_point time) {
  auto time_t = std::chrono::system_clock::to_time_t(time);
  auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
      time.time_since_epoch()) % 1000;

  std::tm tm{};
  gmtime_r(&time_t, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << milliseconds.count() << 'Z';

  return oss.str();
}

Result<std::chrono::system_clock::time_point> Time::fromRfc3339(const std::string& str) {
  static const std::regex rfc3339_regex(
      R"((\d{4})-(\d{2})-(\d{2})T(\d{2}):(\d{2}):(\d{2})(?:\.(\d{3}))?Z?)");

  std::smatch match;
  if (!std::regex_match(str, match, rfc3339_regex)) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid RFC3339 format: " + str));
  }

  std::tm tm = {};
  tm.tm_year = std::stoi(match[1]) - 1900;
  tm.tm_mon = std::stoi(match[2]) - 1;
  tm.tm_mday = std::stoi(match[3]);
  tm.tm_hour = std::stoi(match[4]);
  tm.tm_min = std::stoi(match[5]);
  tm.tm_sec = std::stoi(match[6]);

  auto time_t = timegm(&tm);
  if (time_t == -1) {
    return std::unexpected(makeError(ErrorCode::kParseError,
                                     "Invalid time values: " + str));
  }

  auto time_point = std::chrono::system_clock::from_time_t(time_t);

  // Add milliseconds if present
  if (match[7].matched) {
    time_point += std::chrono::milliseconds(std::stoi(match[7]));
  }

  return time_point;
}

std::chrono::system_clock::time_point Time::now() {
  return std::chrono::system_clock::now();
}

}  // namespace attic::util
