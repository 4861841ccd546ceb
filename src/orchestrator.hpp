#pragma once
#include "config.hpp"
#include "conversation_store.hpp"
#include "provider.hpp"
#include "rpc_client.hpp"
#include <atomic>
#include <iosfwd>
#include <string>

namespace mcprelay {

// Polls the monitored channels through the tool process, answers triggered
// messages with the generation backend, and owns the conversation state.
// Single-threaded: channels are visited one after another and a slow
// generation delays every other channel.
class Orchestrator {
public:
    Orchestrator(const Config& config, RpcClient& rpc, Provider& provider,
                 const std::atomic<bool>* shutdown = nullptr);

    // One fetch/filter/generate/reply pass over a channel. Returns true if a
    // reply was sent. Any failure other than TransportError is logged and the
    // cycle for this channel is abandoned; TransportError propagates.
    bool process_channel(const std::string& channel_id);

    // Visit every monitored channel once. Returns the number of replies sent.
    size_t poll_once();

    // Poll until shutdown is raised, sleeping poll_interval between cycles.
    // With no monitored channels, prints the visible channels to out and returns.
    void run(const std::atomic<bool>& shutdown, std::ostream& out);

    // Print "• name (ID: id) in guild" for every visible channel
    void list_channels(std::ostream& out);

    const ConversationStore& store() const { return store_; }

private:
    std::string generate(const std::string& channel_id);
    void reply(const std::string& channel_id, const std::string& text);
    bool shutdown_requested() const { return shutdown_ && shutdown_->load(); }

    const Config& config_;
    RpcClient& rpc_;
    Provider& provider_;
    const std::atomic<bool>* shutdown_;
    ConversationStore store_;
};

} // namespace mcprelay
