#pragma once

#include <optional>
#include <string>

#include "attic/archive/provider_api.hpp"
#include "attic/archive/types.hpp"
#include "attic/archive/uploader.hpp"
#include "attic/common.hpp"

namespace attic::archive {

/**
 * @brief Regenerates a fresh download URL from stable identifiers
 *
 * Reads the stored message back from the provider and picks the requested
 * attachment (or the first one). Bot credentials use the channel message
 * API; without a bot token the webhook's own message endpoint is used.
 * A webhook can only read messages it posted, and messages posted into a
 * thread need that thread id on the query.
 */
class Rehydrator {
 public:
  Rehydrator(std::string api_base, TransportFactory transport_factory);

  Result<AttachmentRef> fetchAttachment(const std::string& message_id,
                                        const std::string& channel_id,
                                        const Credentials& credentials,
                                        const std::optional<std::string>& attachment_id = std::nullopt,
                                        const std::optional<std::string>& webhook_thread_id = std::nullopt);

 private:
  std::string api_base_;
  TransportFactory transport_factory_;
};

}  // namespace attic::archive
