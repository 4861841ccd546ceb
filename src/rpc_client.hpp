#pragma once
#include "channel.hpp"
#include "transport.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcprelay {

// The peer answered with an "error" member
class RpcError : public std::runtime_error {
public:
    RpcError(int64_t code, const std::string& message, nlohmann::json data = nullptr);

    int64_t code() const { return code_; }
    const std::string& server_message() const { return server_message_; }
    const nlohmann::json& data() const { return data_; }

private:
    int64_t code_;
    std::string server_message_;
    nlohmann::json data_;
};

// A response line did not have the expected shape
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// JSON-RPC 2.0 over a line-framed Transport. One request is outstanding at a
// time; call() is serialized by a mutex.
class RpcClient {
public:
    explicit RpcClient(Transport& transport);

    // Send a request and wait for its response. Returns the "result" member.
    // Throws RpcError, ProtocolError, or TransportError from the transport.
    nlohmann::json call(const std::string& method,
                        const nlohmann::json& params = nlohmann::json::object());

    // tools/call with {name, arguments}
    nlohmann::json call_tool(const std::string& name, const nlohmann::json& arguments);

    // Recent messages for a channel, oldest first
    std::vector<ChannelMessage> fetch_messages(const std::string& channel_id, uint32_t limit);

    // Returns the id of the sent message when the tool reports one
    std::optional<std::string> send_message(const std::string& channel_id,
                                            const std::string& message);

    std::vector<ChannelInfo> list_channels();

    // Tool names advertised by tools/list
    std::vector<std::string> list_tools();

    // Which of the three tools the relay relies on are not advertised
    std::vector<std::string> missing_required_tools();

    // Id the next call() will use
    int64_t next_id() const { return next_id_; }

private:
    nlohmann::json read_response(int64_t id);

    Transport& transport_;
    std::mutex call_mutex_;
    int64_t next_id_ = 1;
};

// Decode the JSON document carried in result.content[0].text.
// Non-JSON text (the tool reports failures as plain "Error: ..." text) yields
// an empty object.
nlohmann::json decode_tool_payload(const nlohmann::json& result);

} // namespace mcprelay
