#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace mcprelay {

struct Config {
    std::string model = "qwen2.5:7b";
    std::string trigger = "!ai";
    std::vector<std::string> channels;  // monitored channel ids; empty = list and exit
    std::string system_prompt = "You are a helpful AI assistant integrated with Discord.";
    std::string system_prompt_file;     // overrides system_prompt when readable

    uint32_t poll_interval = 3;         // seconds between poll cycles
    uint32_t fetch_limit = 100;         // messages requested per channel per cycle
    uint32_t context_window = 8192;     // sent to the backend as num_ctx
    double temperature = 0.7;
    std::string ollama_base_url = "http://localhost:11434";

    // argv of the tool process
    std::vector<std::string> server_command = {"node", "mcp-server/dist/server.js"};
    uint32_t startup_delay = 2;         // seconds given to the tool process to log in
    uint32_t max_message_length = 2000; // replies longer than this are split

    // Load from ~/.mcprelay/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Fill a Config from parsed JSON; unknown or mistyped keys keep their defaults
    static Config from_json(const nlohmann::json& j);

    // Environment variables override whatever the file said
    void apply_env();

    // Replace system_prompt with the contents of system_prompt_file, if set.
    // Relative paths resolve against base_dir. Returns false if the file is unreadable.
    bool resolve_system_prompt(const std::string& base_dir = "");
};

// Parse a comma-separated channel id list, dropping blank entries
std::vector<std::string> parse_channel_list(const std::string& csv);

} // namespace mcprelay
