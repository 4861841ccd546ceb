#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <string>
#include <vector>

namespace mcprelay {

class OllamaProvider : public Provider {
public:
    OllamaProvider(HttpClient& http, const std::string& base_url = "http://localhost:11434");

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::string& model,
                      const ChatOptions& options) override;

    std::string provider_name() const override { return "ollama"; }

    // Names of locally available models (GET /api/tags)
    std::vector<std::string> list_models();

    // Pull a model (POST /api/pull, non-streaming). Blocks until done.
    void pull_model(const std::string& model);

    // Pull the model unless some listed name contains it.
    // Returns true if a pull was performed.
    bool ensure_model(const std::string& model);

private:
    HttpClient& http_;
    std::string base_url_;
};

} // namespace mcprelay
