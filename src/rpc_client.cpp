#include "rpc_client.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace mcprelay {

static std::string error_text(int64_t code, const std::string& message) {
    return "RPC error " + std::to_string(code) + ": " + message;
}

RpcError::RpcError(int64_t code, const std::string& message, json data)
    : std::runtime_error(error_text(code, message)),
      code_(code), server_message_(message), data_(std::move(data)) {}

RpcClient::RpcClient(Transport& transport) : transport_(transport) {}

json RpcClient::call(const std::string& method, const json& params) {
    std::lock_guard<std::mutex> lock(call_mutex_);

    int64_t id = next_id_++;
    json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params.is_null() ? json::object() : params}
    };

    transport_.write_line(request.dump());
    json response = read_response(id);

    bool has_result = response.contains("result");
    bool has_error = response.contains("error");
    if (has_result == has_error) {
        throw ProtocolError("Response " + std::to_string(id) +
                            " must carry exactly one of result/error");
    }

    if (has_error) {
        const auto& err = response["error"];
        int64_t code = 0;
        std::string message;
        json data = nullptr;
        if (err.is_object()) {
            if (err.contains("code") && err["code"].is_number_integer())
                code = err["code"].get<int64_t>();
            if (err.contains("message") && err["message"].is_string())
                message = err["message"].get<std::string>();
            else
                message = err.dump();
            if (err.contains("data")) data = err["data"];
        } else {
            message = err.dump();
        }
        throw RpcError(code, message, data);
    }

    return response["result"];
}

// Skips lines that cannot be responses (non-JSON output, notifications) so
// stray stdout writes from the peer do not desynchronize correlation.
json RpcClient::read_response(int64_t id) {
    while (true) {
        std::string line = transport_.read_line();
        if (trim(line).empty()) continue;

        json msg = json::parse(line, nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) {
            std::cerr << "[rpc] Ignoring non-protocol line: " << preview(line, 80) << "\n";
            continue;
        }
        if (!msg.contains("id") || msg["id"].is_null()) {
            if (msg.contains("method") && msg["method"].is_string()) {
                std::cerr << "[rpc] Ignoring notification "
                          << msg["method"].get<std::string>() << "\n";
                continue;
            }
            // Parse errors are reported with a null id
            if (msg.contains("error")) return msg;
            std::cerr << "[rpc] Ignoring message without id: " << preview(line, 80) << "\n";
            continue;
        }
        if (!msg["id"].is_number_integer()) {
            throw ProtocolError("Response id is not an integer: " + msg["id"].dump());
        }
        int64_t got = msg["id"].get<int64_t>();
        if (got != id) {
            throw ProtocolError("Response id " + std::to_string(got) +
                                " does not match request " + std::to_string(id));
        }
        return msg;
    }
}

json RpcClient::call_tool(const std::string& name, const json& arguments) {
    return call("tools/call", {{"name", name}, {"arguments", arguments}});
}

json decode_tool_payload(const json& result) {
    if (!result.is_object() || !result.contains("content") ||
        !result["content"].is_array() || result["content"].empty()) {
        return json::object();
    }
    const auto& first = result["content"][0];
    if (!first.is_object() || !first.contains("text") || !first["text"].is_string()) {
        return json::object();
    }

    const std::string text = first["text"].get<std::string>();
    json payload = json::parse(text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        std::cerr << "[rpc] Tool returned non-JSON payload: " << preview(text, 200) << "\n";
        return json::object();
    }
    return payload;
}

static std::string string_field(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return {};
}

std::vector<ChannelMessage> RpcClient::fetch_messages(const std::string& channel_id,
                                                      uint32_t limit) {
    json result = call_tool("read_discord_messages",
                            {{"channel_id", channel_id}, {"limit", limit}});
    json payload = decode_tool_payload(result);

    std::vector<ChannelMessage> messages;
    if (!payload.contains("messages") || !payload["messages"].is_array()) return messages;

    for (const auto& m : payload["messages"]) {
        if (!m.is_object() || !m.contains("id") || !m["id"].is_string()) {
            throw ProtocolError("Message record without a string id in channel " + channel_id);
        }
        ChannelMessage msg;
        msg.id = m["id"].get<std::string>();
        msg.author = string_field(m, "author");
        msg.content = string_field(m, "content");
        msg.channel = channel_id;
        msg.timestamp = string_field(m, "timestamp");
        if (m.contains("attachments") && m["attachments"].is_array()) {
            for (const auto& a : m["attachments"]) {
                if (a.is_string()) msg.attachments.push_back(a.get<std::string>());
            }
        }
        messages.push_back(std::move(msg));
    }
    return messages;
}

std::optional<std::string> RpcClient::send_message(const std::string& channel_id,
                                                   const std::string& message) {
    json result = call_tool("send_discord_message",
                            {{"channel_id", channel_id}, {"message", message}});
    json payload = decode_tool_payload(result);
    if (payload.contains("message_id") && payload["message_id"].is_string())
        return payload["message_id"].get<std::string>();
    return std::nullopt;
}

std::vector<ChannelInfo> RpcClient::list_channels() {
    json payload = decode_tool_payload(call_tool("list_discord_channels", json::object()));

    std::vector<ChannelInfo> channels;
    if (!payload.contains("channels") || !payload["channels"].is_array()) return channels;

    for (const auto& c : payload["channels"]) {
        if (!c.is_object()) continue;
        ChannelInfo info;
        info.id = string_field(c, "id");
        info.name = string_field(c, "name");
        info.guild = string_field(c, "guild");
        if (c.contains("type") && c["type"].is_number_integer())
            info.type = c["type"].get<int>();
        channels.push_back(std::move(info));
    }
    return channels;
}

std::vector<std::string> RpcClient::list_tools() {
    json result = call("tools/list");
    std::vector<std::string> names;
    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
        throw ProtocolError("tools/list result has no tools array");
    for (const auto& t : result["tools"]) {
        if (t.is_object() && t.contains("name") && t["name"].is_string())
            names.push_back(t["name"].get<std::string>());
    }
    return names;
}

std::vector<std::string> RpcClient::missing_required_tools() {
    static const char* const kRequired[] = {
        "read_discord_messages", "send_discord_message", "list_discord_channels"
    };
    auto advertised = list_tools();
    std::vector<std::string> missing;
    for (const char* name : kRequired) {
        if (std::find(advertised.begin(), advertised.end(), name) == advertised.end())
            missing.push_back(name);
    }
    return missing;
}

} // namespace mcprelay
