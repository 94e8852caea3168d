#include "chanvault/transport/credential_pool.hpp"

namespace chanvault::transport {

void CredentialPool::set(const std::vector<std::string>& tokens, ChannelId channel) {
    std::lock_guard lock(mutex_);
    auto& entry = entries_[channel];
    if (entry.tokens == tokens) return;
    entry.tokens = tokens;
    entry.cursor = entry.tokens.empty() ? 0 : entry.cursor % entry.tokens.size();
}

std::optional<std::pair<std::string, size_t>> CredentialPool::next(ChannelId channel) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(channel);
    if (it == entries_.end() || it->second.tokens.empty()) return std::nullopt;

    auto& entry = it->second;
    size_t index = entry.cursor;
    entry.cursor = (entry.cursor + 1) % entry.tokens.size();
    return std::make_pair(entry.tokens[index], index);
}

size_t CredentialPool::size(ChannelId channel) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(channel);
    return it == entries_.end() ? 0 : it->second.tokens.size();
}

}  // namespace chanvault::transport
