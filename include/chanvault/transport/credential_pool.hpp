#pragma once

#include "chanvault/transport/transport.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chanvault::transport {

/// Delegated worker tokens per destination channel, handed out round-robin.
///
/// Shared across all requests. The rotation cursor is internal; callers only
/// see the token and its index in the current list.
class CredentialPool {
public:
    /// Replace the token list for a channel if it differs from the stored one.
    /// The cursor is kept, reduced modulo the new length.
    void set(const std::vector<std::string>& tokens, ChannelId channel);

    /// Next token for a channel and its index, or nullopt when the channel
    /// has no tokens.
    std::optional<std::pair<std::string, size_t>> next(ChannelId channel);

    /// Number of tokens registered for a channel
    size_t size(ChannelId channel) const;

private:
    struct Entry {
        std::vector<std::string> tokens;
        size_t cursor = 0;
    };

    mutable std::mutex mutex_;
    std::unordered_map<ChannelId, Entry> entries_;
};

}  // namespace chanvault::transport
