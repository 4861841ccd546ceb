#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace mcprelay {

nlohmann::json Config::defaults_json() {
    Config d;
    return {
        {"model", d.model},
        {"trigger", d.trigger},
        {"channels", nlohmann::json::array()},
        {"system_prompt", d.system_prompt},
        {"system_prompt_file", ""},
        {"poll_interval", d.poll_interval},
        {"fetch_limit", d.fetch_limit},
        {"context_window", d.context_window},
        {"temperature", d.temperature},
        {"ollama_base_url", d.ollama_base_url},
        {"server_command", d.server_command},
        {"startup_delay", d.startup_delay},
        {"max_message_length", d.max_message_length}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_uint(const nlohmann::json& j, const char* key, uint32_t& out) {
    if (j.contains(key) && j[key].is_number_unsigned())
        out = j[key].get<uint32_t>();
}

static void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string())
        out = j[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    read_string(j, "model", cfg.model);
    read_string(j, "trigger", cfg.trigger);
    read_string(j, "system_prompt", cfg.system_prompt);
    read_string(j, "system_prompt_file", cfg.system_prompt_file);
    read_string(j, "ollama_base_url", cfg.ollama_base_url);

    read_uint(j, "poll_interval", cfg.poll_interval);
    read_uint(j, "fetch_limit", cfg.fetch_limit);
    read_uint(j, "context_window", cfg.context_window);
    read_uint(j, "startup_delay", cfg.startup_delay);
    read_uint(j, "max_message_length", cfg.max_message_length);

    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();

    if (j.contains("channels") && j["channels"].is_array()) {
        cfg.channels.clear();
        for (const auto& ch : j["channels"]) {
            if (!ch.is_string()) continue;
            std::string id = trim(ch.get<std::string>());
            if (!id.empty()) cfg.channels.push_back(id);
        }
    }

    if (j.contains("server_command") && j["server_command"].is_array()) {
        std::vector<std::string> argv;
        for (const auto& arg : j["server_command"]) {
            if (arg.is_string()) argv.push_back(arg.get<std::string>());
        }
        if (!argv.empty()) cfg.server_command = std::move(argv);
    }

    return cfg;
}

void Config::apply_env() {
    if (const char* v = std::getenv("OLLAMA_MODEL"))
        model = v;
    if (const char* v = std::getenv("BOT_TRIGGER_PREFIX"))
        trigger = v;
    if (const char* v = std::getenv("MONITORED_CHANNEL_IDS"))
        channels = parse_channel_list(v);
    if (const char* v = std::getenv("SYSTEM_PROMPT"))
        system_prompt = v;
    if (const char* v = std::getenv("SYSTEM_PROMPT_FILE"))
        system_prompt_file = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        ollama_base_url = v;
    if (const char* v = std::getenv("POLL_INTERVAL")) {
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if (end != v && *end == '\0') poll_interval = static_cast<uint32_t>(n);
    }
    if (const char* v = std::getenv("OLLAMA_NUM_CTX")) {
        char* end = nullptr;
        unsigned long n = std::strtoul(v, &end, 10);
        if (end != v && *end == '\0' && n > 0) context_window = static_cast<uint32_t>(n);
    }
    if (const char* v = std::getenv("MCP_SERVER_COMMAND")) {
        auto argv = split_whitespace(v);
        if (!argv.empty()) server_command = std::move(argv);
    }
}

bool Config::resolve_system_prompt(const std::string& base_dir) {
    if (system_prompt_file.empty()) return true;

    std::filesystem::path path = expand_home(system_prompt_file);
    if (path.is_relative() && !base_dir.empty())
        path = std::filesystem::path(base_dir) / path;

    std::string contents;
    if (!read_file(path.string(), contents)) {
        std::cerr << "[config] System prompt file not found: " << path.string()
                  << " (using default system prompt)\n";
        return false;
    }
    system_prompt = trim(contents);
    return true;
}

Config Config::load() {
    std::string config_path = expand_home("~/.mcprelay/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    cfg.apply_env();
    return cfg;
}

std::vector<std::string> parse_channel_list(const std::string& csv) {
    std::vector<std::string> ids;
    for (const auto& part : split(csv, ',')) {
        std::string id = trim(part);
        if (!id.empty()) ids.push_back(id);
    }
    return ids;
}

} // namespace mcprelay
