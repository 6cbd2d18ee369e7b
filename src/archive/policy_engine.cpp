#include "attic/archive/policy_engine.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace attic::archive {

Result<ContentVerdict> AllowAllContentPolicy::evaluate(const std::filesystem::path& /*path*/,
                                                       const ArchiveMeta& /*meta*/) {
  return ContentVerdict{};
}

PolicyEngine::PolicyEngine(config::PolicySettings settings,
                           std::shared_ptr<ContentPolicy> content_policy)
    : settings_(std::move(settings)), content_policy_(std::move(content_policy)) {
  if (!content_policy_) {
    content_policy_ = std::make_shared<AllowAllContentPolicy>();
  }
}

bool PolicyEngine::isDenied(const std::string& extension) const {
  const auto& deny = settings_.deny_extensions;
  return !extension.empty() && std::find(deny.begin(), deny.end(), extension) != deny.end();
}

bool PolicyEngine::isKnown(const std::string& extension) const {
  if (extension.empty()) {
    return false;
  }
  return std::any_of(settings_.allow.begin(), settings_.allow.end(), [&](const auto& entry) {
    const auto& list = entry.second;
    return std::find(list.begin(), list.end(), extension) != list.end();
  });
}

PolicyDecision PolicyEngine::check(const std::filesystem::path& path,
                                   const ArchiveMeta& meta) const {
  PolicyDecision decision;
  auto& reasons = decision.reasons;

  if (meta.do_not_archive) {
    reasons.push_back("do_not_archive flag set");
  }

  std::string ext = normalizeExtension(path);
  if (isDenied(ext)) {
    reasons.push_back("extension '" + ext + "' is denied");
  } else if (!isKnown(ext)) {
    reasons.push_back("unknown file type '" + (ext.empty() ? std::string("<none>") : ext) + "'");
  }

  auto verdict = content_policy_->evaluate(path, meta);
  if (!verdict) {
    reasons.push_back("content policy unavailable: " + verdict.error().message());
  } else if (verdict->block) {
    if (verdict->reasons.empty()) {
      reasons.push_back("blocked by content policy");
    }
    reasons.insert(reasons.end(), verdict->reasons.begin(), verdict->reasons.end());
  }

  std::uint64_t limit = meta.size_limit.value_or(settings_.max_file_bytes);
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    reasons.push_back("file not readable");
  } else if (size > limit) {
    reasons.push_back("file size " + std::to_string(size) + " exceeds limit " +
                      std::to_string(limit));
  }

  decision.allowed = reasons.empty();
  if (!decision.allowed) {
    spdlog::warn("Policy denied {}: {} reason(s)", path.filename().string(), reasons.size());
  }
  return decision;
}

}  // namespace attic::archive
