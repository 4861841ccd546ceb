#include "conversation_store.hpp"

namespace mcprelay {

size_t ConversationStore::ingest(const std::string& channel,
                                 const std::vector<ChannelMessage>& messages) {
    auto& history = histories_[channel];
    size_t added = 0;
    for (const auto& msg : messages) {
        // insert() reports whether the key was new; history follows it exactly
        if (processed_.insert(composite_key(channel, msg.id)).second) {
            history.push_back(msg);
            history.back().channel = channel;
            ++added;
        }
    }
    return added;
}

void ConversationStore::mark_processed_without_storing(const std::string& channel,
                                                       const std::string& id) {
    processed_.insert(composite_key(channel, id));
}

bool ConversationStore::is_processed(const std::string& channel, const std::string& id) const {
    return processed_.count(composite_key(channel, id)) > 0;
}

std::vector<ChatMessage> ConversationStore::build_context(const std::string& channel,
                                                          const std::string& system_prompt) const {
    const auto& stored = history(channel);

    std::vector<ChatMessage> context;
    context.reserve(stored.size() + 1);
    context.push_back({Role::System, system_prompt});
    for (const auto& msg : stored) {
        context.push_back({Role::User, "[" + msg.author + "]: " + msg.content});
    }
    return context;
}

const std::vector<ChannelMessage>& ConversationStore::history(const std::string& channel) const {
    static const std::vector<ChannelMessage> empty;
    auto it = histories_.find(channel);
    if (it == histories_.end()) return empty;
    return it->second;
}

size_t ConversationStore::history_size(const std::string& channel) const {
    return history(channel).size();
}

} // namespace mcprelay
