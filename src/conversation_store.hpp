#pragma once
#include "channel.hpp"
#include "provider.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mcprelay {

// Per-channel transcript plus the set of every (channel, id) ever seen.
// History keeps arrival order and is never truncated; the processed set only
// grows. Both live for the lifetime of the store.
class ConversationStore {
public:
    // Append each message whose composite key has not been seen, in order.
    // Returns the number of messages appended.
    size_t ingest(const std::string& channel, const std::vector<ChannelMessage>& messages);

    // Record the key without touching history
    void mark_processed_without_storing(const std::string& channel, const std::string& id);

    bool is_processed(const std::string& channel, const std::string& id) const;

    // System prompt followed by every stored message as "[author]: content"
    std::vector<ChatMessage> build_context(const std::string& channel,
                                           const std::string& system_prompt) const;

    // Empty if the channel has never been ingested
    const std::vector<ChannelMessage>& history(const std::string& channel) const;

    size_t history_size(const std::string& channel) const;
    size_t processed_count() const { return processed_.size(); }
    size_t channel_count() const { return histories_.size(); }

private:
    std::unordered_map<std::string, std::vector<ChannelMessage>> histories_;
    std::unordered_set<std::string> processed_;
};

} // namespace mcprelay
