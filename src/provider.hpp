#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace mcprelay {

enum class Role { System, User, Assistant };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

struct ChatMessage {
    Role role;
    std::string content;
};

// Sampling options forwarded to the backend
struct ChatOptions {
    double temperature = 0.7;
    uint32_t num_ctx = 8192;
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::optional<std::string> content;
    TokenUsage usage;
    std::string model;
};

// Abstract base class for generation backends.
// chat() throws on any failure; callers decide how to degrade.
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::string& model,
                              const ChatOptions& options) = 0;

    virtual std::string provider_name() const = 0;
};

} // namespace mcprelay
