#include "channel.hpp"

namespace mcprelay {

std::string composite_key(const std::string& channel, const std::string& id) {
    return channel + ":" + id;
}

static bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Move a hard cut back so it never lands inside a UTF-8 sequence. If max_len
// is smaller than one character, the whole character goes into the chunk.
static size_t utf8_boundary(const std::string& text, size_t pos, size_t end) {
    size_t split = end;
    while (split > pos && is_continuation(text[split])) --split;
    if (split > pos) return split;
    split = end;
    while (split < text.size() && is_continuation(text[split])) ++split;
    return split;
}

std::vector<std::string> split_message(const std::string& text, size_t max_len) {
    std::vector<std::string> parts;
    if (text.empty() || max_len == 0) return parts;
    if (text.size() <= max_len) {
        parts.push_back(text);
        return parts;
    }

    size_t pos = 0;
    while (pos < text.size()) {
        size_t remaining = text.size() - pos;
        if (remaining <= max_len) {
            parts.push_back(text.substr(pos));
            break;
        }

        size_t end = pos + max_len;
        size_t split = end;

        // Prefer splitting at newline, then space; otherwise hard cut
        size_t nl = text.rfind('\n', end - 1);
        if (nl != std::string::npos && nl > pos) {
            split = nl + 1;
        } else {
            size_t sp = text.rfind(' ', end - 1);
            if (sp != std::string::npos && sp > pos) {
                split = sp + 1;
            } else {
                split = utf8_boundary(text, pos, end);
            }
        }

        parts.push_back(text.substr(pos, split - pos));
        pos = split;
    }

    return parts;
}

} // namespace mcprelay
