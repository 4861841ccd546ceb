#include "config.hpp"
#include "http.hpp"
#include "orchestrator.hpp"
#include "providers/ollama.hpp"
#include "rpc_client.hpp"
#include "transport.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: mcprelay [options]\n"
              << "\n"
              << "Options:\n"
              << "  --model NAME         Ollama model to answer with\n"
              << "  --trigger PREFIX     Prefix a message must start with to be answered\n"
              << "  --channels IDS       Comma-separated channel ids to monitor\n"
              << "  --server CMD         Tool process command line\n"
              << "  --list-channels      List visible channels and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables (override ~/.mcprelay/config.json):\n"
              << "  OLLAMA_MODEL           Model name (default: qwen2.5:7b)\n"
              << "  OLLAMA_BASE_URL        Base URL for Ollama (default: http://localhost:11434)\n"
              << "  OLLAMA_NUM_CTX         Context window sent to Ollama (default: 8192)\n"
              << "  BOT_TRIGGER_PREFIX     Trigger prefix (default: !ai)\n"
              << "  MONITORED_CHANNEL_IDS  Comma-separated channel ids\n"
              << "  SYSTEM_PROMPT          Inline system prompt\n"
              << "  SYSTEM_PROMPT_FILE     File whose contents replace the system prompt\n"
              << "  POLL_INTERVAL          Seconds between poll cycles (default: 3)\n"
              << "  MCP_SERVER_COMMAND     Tool process command line\n";
}

static void sleep_unless_shutdown(uint32_t seconds) {
    auto wake = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (!g_shutdown.load() && std::chrono::steady_clock::now() < wake) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

static int run_bot(const mcprelay::Config& config, bool list_only) {
    mcprelay::CurlHttpClient http_client;
    mcprelay::OllamaProvider provider(http_client, config.ollama_base_url);

    std::cerr << "[mcprelay] Model: " << config.model
              << " | Trigger: " << config.trigger << "\n";

    if (!list_only) {
        try {
            provider.ensure_model(config.model);
        } catch (const std::exception& e) {
            std::cerr << "[mcprelay] Error checking Ollama: " << e.what() << "\n"
                      << "[mcprelay] Make sure Ollama is running: ollama serve\n";
            return 1;
        }
    }

    // Destructor stops the tool process on every path out of this scope
    mcprelay::ProcessTransport transport(config.server_command, &g_shutdown);
    transport.start();
    sleep_unless_shutdown(config.startup_delay);

    mcprelay::RpcClient rpc(transport);
    try {
        for (const auto& name : rpc.missing_required_tools()) {
            std::cerr << "[mcprelay] Warning: tool process does not advertise " << name << "\n";
        }
    } catch (const mcprelay::RpcError& e) {
        std::cerr << "[mcprelay] Warning: tools/list failed: " << e.what() << "\n";
    } catch (const mcprelay::ProtocolError& e) {
        std::cerr << "[mcprelay] Warning: tools/list failed: " << e.what() << "\n";
    }

    mcprelay::Orchestrator orchestrator(config, rpc, provider, &g_shutdown);

    try {
        if (list_only) {
            orchestrator.list_channels(std::cout);
        } else {
            orchestrator.run(g_shutdown, std::cout);
        }
    } catch (const mcprelay::CancelledError&) {
        std::cerr << "[mcprelay] Interrupted\n";
    } catch (const mcprelay::StreamClosedError& e) {
        std::cerr << "[mcprelay] Tool process went away: " << e.what() << "\n";
        transport.stop();
        return 1;
    }

    std::cerr << "[mcprelay] Shutting down.\n";
    transport.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string model_name;
    std::string trigger;
    std::string channels;
    std::string server;
    bool have_trigger = false;
    bool have_channels = false;
    bool list_only = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--trigger") == 0 && i + 1 < argc) {
            trigger = argv[++i];
            have_trigger = true;
        } else if (std::strcmp(argv[i], "--channels") == 0 && i + 1 < argc) {
            channels = argv[++i];
            have_channels = true;
        } else if (std::strcmp(argv[i], "--server") == 0 && i + 1 < argc) {
            server = argv[++i];
        } else if (std::strcmp(argv[i], "--list-channels") == 0) {
            list_only = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = mcprelay::Config::load();

    // Override config with CLI args
    if (!model_name.empty()) config.model = model_name;
    if (have_trigger) config.trigger = trigger;
    if (have_channels) config.channels = mcprelay::parse_channel_list(channels);
    if (!server.empty()) {
        auto argv_list = mcprelay::split_whitespace(server);
        if (!argv_list.empty()) config.server_command = std::move(argv_list);
    }
    config.resolve_system_prompt();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    mcprelay::http_init();
    mcprelay::http_set_abort_flag(&g_shutdown);

    int rc = run_bot(config, list_only);

    mcprelay::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
