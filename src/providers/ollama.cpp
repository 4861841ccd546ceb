#include "ollama.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace mcprelay {

static const std::vector<Header> kJsonHeaders = {
    {"Content-Type", "application/json"}
};

static void check_status(const HttpResponse& response, const char* what) {
    if (response.status_code == 0) {
        throw std::runtime_error(std::string("Ollama ") + what +
            " failed (is `ollama serve` running?): " + response.body);
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw std::runtime_error(std::string("Ollama ") + what + " error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }
}

OllamaProvider::OllamaProvider(HttpClient& http, const std::string& base_url)
    : http_(http), base_url_(base_url) {}

ChatResponse OllamaProvider::chat(const std::vector<ChatMessage>& messages,
                                   const std::string& model,
                                   const ChatOptions& options) {
    json request;
    request["model"] = model;
    request["stream"] = false;

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;
    request["options"] = {
        {"temperature", options.temperature},
        {"num_ctx", options.num_ctx}
    };

    auto response = http_.post(base_url_ + "/api/chat", request.dump(), kJsonHeaders);
    check_status(response, "chat");

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Ollama chat returned invalid JSON: ") + e.what());
    }

    if (!resp.is_object() || !resp.contains("message") || !resp["message"].is_object() ||
        !resp["message"].contains("content") || !resp["message"]["content"].is_string()) {
        if (resp.is_object() && resp.contains("error") && resp["error"].is_string())
            throw std::runtime_error("Ollama chat error: " + resp["error"].get<std::string>());
        throw std::runtime_error("Ollama chat response has no message.content");
    }

    ChatResponse result;
    result.model = resp.value("model", model);
    result.content = resp["message"]["content"].get<std::string>();

    if (resp.contains("prompt_eval_count") && resp["prompt_eval_count"].is_number_unsigned()) {
        result.usage.prompt_tokens = resp["prompt_eval_count"].get<uint32_t>();
    }
    if (resp.contains("eval_count") && resp["eval_count"].is_number_unsigned()) {
        result.usage.completion_tokens = resp["eval_count"].get<uint32_t>();
    }
    result.usage.total_tokens = result.usage.prompt_tokens + result.usage.completion_tokens;

    return result;
}

std::vector<std::string> OllamaProvider::list_models() {
    auto response = http_.get(base_url_ + "/api/tags", {});
    check_status(response, "list models");

    std::vector<std::string> names;
    json resp = json::parse(response.body, nullptr, false);
    if (resp.is_discarded() || !resp.is_object() || !resp.contains("models") ||
        !resp["models"].is_array()) {
        throw std::runtime_error("Ollama /api/tags returned an unexpected body");
    }
    for (const auto& m : resp["models"]) {
        if (m.is_object() && m.contains("name") && m["name"].is_string())
            names.push_back(m["name"].get<std::string>());
    }
    return names;
}

void OllamaProvider::pull_model(const std::string& model) {
    json request = {{"model", model}, {"stream", false}};
    // Pulls can take many minutes on a slow link
    auto response = http_.post(base_url_ + "/api/pull", request.dump(), kJsonHeaders, 3600);
    check_status(response, "pull");

    json resp = json::parse(response.body, nullptr, false);
    if (!resp.is_discarded() && resp.is_object() && resp.contains("error") &&
        resp["error"].is_string()) {
        throw std::runtime_error("Ollama pull error: " + resp["error"].get<std::string>());
    }
}

bool OllamaProvider::ensure_model(const std::string& model) {
    for (const auto& name : list_models()) {
        if (name.find(model) != std::string::npos) return false;
    }
    std::cerr << "[ollama] Pulling model " << model << "...\n";
    pull_model(model);
    std::cerr << "[ollama] Model " << model << " downloaded\n";
    return true;
}

} // namespace mcprelay
