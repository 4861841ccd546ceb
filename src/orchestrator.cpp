#include "orchestrator.hpp"
#include "util.hpp"
#include <chrono>
#include <iostream>
#include <thread>

namespace mcprelay {

Orchestrator::Orchestrator(const Config& config, RpcClient& rpc, Provider& provider,
                           const std::atomic<bool>* shutdown)
    : config_(config), rpc_(rpc), provider_(provider), shutdown_(shutdown) {}

bool Orchestrator::process_channel(const std::string& channel_id) {
    try {
        auto messages = rpc_.fetch_messages(channel_id, config_.fetch_limit);
        if (messages.empty()) return false;

        // Only the newest message decides whether there is anything to answer
        auto& last = messages.back();
        if (store_.is_processed(channel_id, last.id)) return false;

        if (!starts_with(last.content, config_.trigger)) {
            store_.mark_processed_without_storing(channel_id, last.id);
            return false;
        }

        std::cerr << "[orchestrator] [" << last.author << "]: "
                  << preview(last.content, 50) << "\n";
        std::cerr << "[orchestrator] Fetched " << messages.size()
                  << " messages for analysis\n";

        last.content = trim(last.content.substr(config_.trigger.size()));

        // The whole window is merged so messages missed between polls are backfilled
        store_.ingest(channel_id, messages);

        std::string response = generate(channel_id);
        if (shutdown_requested()) {
            throw CancelledError("Shutdown requested during generation");
        }

        reply(channel_id, response);
        return true;
    } catch (const RpcError& e) {
        std::cerr << "[orchestrator] Error processing channel " << channel_id
                  << ": " << e.what() << "\n";
    } catch (const ProtocolError& e) {
        std::cerr << "[orchestrator] Protocol error on channel " << channel_id
                  << ": " << e.what() << "\n";
    } catch (const TransportError&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[orchestrator] Abandoning cycle for channel " << channel_id
                  << ": " << e.what() << "\n";
    }
    return false;
}

std::string Orchestrator::generate(const std::string& channel_id) {
    auto context = store_.build_context(channel_id, config_.system_prompt);
    std::cerr << "[orchestrator] Using " << (context.size() - 1)
              << " messages for context\n";

    ChatOptions options;
    options.temperature = config_.temperature;
    options.num_ctx = config_.context_window;

    try {
        auto response = provider_.chat(context, config_.model, options);
        std::cerr << "[orchestrator] " << provider_.provider_name() << " used "
                  << response.usage.total_tokens << " tokens ("
                  << response.usage.prompt_tokens << " prompt)\n";
        return response.content.value_or("");
    } catch (const std::exception& e) {
        std::string error_msg = std::string("Error generating response: ") + e.what();
        std::cerr << "[orchestrator] " << error_msg << "\n";
        return error_msg;
    }
}

void Orchestrator::reply(const std::string& channel_id, const std::string& text) {
    auto chunks = split_message(text, config_.max_message_length);
    if (chunks.empty()) {
        std::cerr << "[orchestrator] Backend returned an empty reply for channel "
                  << channel_id << ", nothing sent\n";
        return;
    }
    for (const auto& chunk : chunks) {
        rpc_.send_message(channel_id, chunk);
    }
    std::cerr << "[orchestrator] Response sent to " << channel_id;
    if (chunks.size() > 1) std::cerr << " in " << chunks.size() << " parts";
    std::cerr << "\n";
}

size_t Orchestrator::poll_once() {
    size_t replies = 0;
    for (const auto& channel_id : config_.channels) {
        if (shutdown_requested()) break;
        if (process_channel(channel_id)) ++replies;
    }
    return replies;
}

void Orchestrator::list_channels(std::ostream& out) {
    auto channels = rpc_.list_channels();
    if (channels.empty()) {
        out << "   (no visible channels)\n";
    }
    for (const auto& ch : channels) {
        out << "   \xE2\x80\xA2 " << ch.name << " (ID: " << ch.id << ") in " << ch.guild << "\n";
    }
    out << "\n   Add channel IDs to MONITORED_CHANNEL_IDS to start monitoring\n";
}

void Orchestrator::run(const std::atomic<bool>& shutdown, std::ostream& out) {
    if (config_.channels.empty()) {
        std::cerr << "[orchestrator] No channels configured, listing available channels\n";
        list_channels(out);
        return;
    }

    std::cerr << "[orchestrator] Monitoring " << config_.channels.size()
              << " channel(s), polling every " << config_.poll_interval << "s\n";

    constexpr auto kSleepSlice = std::chrono::milliseconds(100);
    while (!shutdown.load()) {
        poll_once();

        auto wake = std::chrono::steady_clock::now() +
                    std::chrono::seconds(config_.poll_interval);
        while (!shutdown.load() && std::chrono::steady_clock::now() < wake) {
            std::this_thread::sleep_for(kSleepSlice);
        }
    }
    std::cerr << "[orchestrator] Shutdown requested, leaving poll loop\n";
}

} // namespace mcprelay
