#pragma once

#include <chrono>
#include <string>

#include "attic/common.hpp"

namespace attic::util {

// Time utilities for RFC3339 formatting and parsing
class Time {
 public:
  // Format time as RFC3339 string (ISO 8601, UTC, millisecond precision)
  static std::string toRfc3339(std::chrono::system_clock::time_point time);

  // Parse RFC3339 string to time_point
  static Result<std::chrono::system_clock::time_point> fromRfc3339(const std::string& str);

  // Get current time
  static std::chrono::system_clock::time_point now();
};

}  // namespace attic::util
