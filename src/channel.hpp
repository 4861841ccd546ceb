#pragma once
#include <string>
#include <vector>

namespace mcprelay {

// A chat message as reported by the tool process.
// Identity is (channel, id); ids alone are not unique across channels.
struct ChannelMessage {
    std::string id;
    std::string author;
    std::string content;
    std::string channel;
    std::string timestamp;              // ISO 8601, may be empty
    std::vector<std::string> attachments;
};

struct ChannelInfo {
    std::string id;
    std::string name;
    std::string guild;
    int type = 0;
};

// Composite dedup key "channel:id"
std::string composite_key(const std::string& channel, const std::string& id);

// Split a message into chunks respecting max_len, preferring newline/space boundaries
std::vector<std::string> split_message(const std::string& text, size_t max_len);

} // namespace mcprelay
