#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace attic::util {

// Read-only view of process configuration variables
class Environment {
 public:
  virtual ~Environment() = default;

  virtual std::optional<std::string> get(const std::string& name) const = 0;

  // Parse a boolean flag (1/true/yes/on, case-insensitive)
  std::optional<bool> getBool(const std::string& name) const;
};

// Reads the live process environment on every call
class ProcessEnvironment : public Environment {
 public:
  std::optional<std::string> get(const std::string& name) const override;
};

// Fixed set of variables, used by tests and embedding callers
class MapEnvironment : public Environment {
 public:
  MapEnvironment() = default;
  explicit MapEnvironment(std::unordered_map<std::string, std::string> values)
      : values_(std::move(values)) {}

  std::optional<std::string> get(const std::string& name) const override;

  void set(const std::string& name, const std::string& value) { values_[name] = value; }
  void unset(const std::string& name) { values_.erase(name); }

 private:
  std::unordered_map<std::string, std::string> values_;
};

}  // namespace attic::util
