#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "attic/archive/types.hpp"
#include "attic/common.hpp"
#include "attic/config/settings.hpp"

namespace attic::archive {

struct ContentVerdict {
  bool block = false;
  std::vector<std::string> reasons;
};

// External content-policy collaborator (moderation, classification, ...)
class ContentPolicy {
 public:
  virtual ~ContentPolicy() = default;

  virtual Result<ContentVerdict> evaluate(const std::filesystem::path& path,
                                          const ArchiveMeta& meta) = 0;
};

class AllowAllContentPolicy : public ContentPolicy {
 public:
  Result<ContentVerdict> evaluate(const std::filesystem::path& path,
                                  const ArchiveMeta& meta) override;
};

/**
 * @brief Accepts or rejects a candidate file
 *
 * Every check runs; all failures are reported together. A file is
 * allowed iff no reasons were collected.
 */
class PolicyEngine {
 public:
  PolicyEngine(config::PolicySettings settings, std::shared_ptr<ContentPolicy> content_policy);

  PolicyDecision check(const std::filesystem::path& path, const ArchiveMeta& meta) const;

  bool isDenied(const std::string& extension) const;
  bool isKnown(const std::string& extension) const;

 private:
  config::PolicySettings settings_;
  std::shared_ptr<ContentPolicy> content_policy_;
};

}  // namespace attic::archive
