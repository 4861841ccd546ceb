#include <catch2/catch_test_macros.hpp>
#include "mock_provider.hpp"
#include "mock_transport.hpp"
#include "orchestrator.hpp"
#include <atomic>
#include <csignal>
#include <sstream>
#include <sys/types.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace mcprelay;

static Config test_config(std::vector<std::string> channels = {"chan"}) {
    Config cfg;
    cfg.channels = std::move(channels);
    cfg.system_prompt = "You are a test bot.";
    cfg.poll_interval = 0;
    cfg.startup_delay = 0;
    return cfg;
}

// Everything needed to drive an Orchestrator against a scripted tool process
struct Harness {
    Config config;
    MockTransport transport;
    FakeToolServer server;
    MockProvider provider;
    RpcClient rpc{transport};
    Orchestrator orchestrator;

    explicit Harness(Config cfg = test_config(), const std::atomic<bool>* shutdown = nullptr)
        : config(std::move(cfg)), orchestrator(config, rpc, provider, shutdown) {
        server.attach(transport);
    }

    void set_messages(const std::string& channel, json msgs) {
        server.messages[channel] = std::move(msgs);
    }
};

// ── Scenarios ────────────────────────────────────────────────────

TEST_CASE("Orchestrator: untriggered message is marked but not stored", "[orchestrator]") {
    Harness h;
    h.set_messages("chan", json::array({message_json("1", "alice", "hello")}));

    REQUIRE_FALSE(h.orchestrator.process_channel("chan"));

    REQUIRE(h.orchestrator.store().is_processed("chan", "1"));
    REQUIRE(h.orchestrator.store().history_size("chan") == 0);
    REQUIRE(h.provider.call_count == 0);
    REQUIRE(h.server.sent.empty());
}

TEST_CASE("Orchestrator: triggered message is answered with stripped content", "[orchestrator]") {
    Harness h;
    h.provider.reply = "It is noon.";
    h.set_messages("chan", json::array({message_json("2", "bob", "!ai what time is it")}));

    REQUIRE(h.orchestrator.process_channel("chan"));

    REQUIRE(h.provider.call_count == 1);
    REQUIRE(h.provider.last_messages.size() == 2);
    REQUIRE(h.provider.last_messages[0].role == Role::System);
    REQUIRE(h.provider.last_messages[0].content == "You are a test bot.");
    REQUIRE(h.provider.last_messages[1].role == Role::User);
    REQUIRE(h.provider.last_messages[1].content == "[bob]: what time is it");
    REQUIRE(h.provider.last_model == "qwen2.5:7b");
    REQUIRE(h.provider.last_options.temperature == 0.7);
    REQUIRE(h.provider.last_options.num_ctx == 8192);

    REQUIRE(h.server.sent.size() == 1);
    REQUIRE(h.server.sent[0].first == "chan");
    REQUIRE(h.server.sent[0].second == "It is noon.");
    REQUIRE(h.orchestrator.store().is_processed("chan", "2"));
}

TEST_CASE("Orchestrator: backend failure is sent as an error reply", "[orchestrator]") {
    Harness h;
    h.provider.fail = true;
    h.set_messages("chan", json::array({message_json("3", "carol", "!ai hi")}));

    REQUIRE(h.orchestrator.process_channel("chan"));
    REQUIRE(h.server.sent.size() == 1);
    REQUIRE(h.server.sent[0].second == "Error generating response: connection refused");

    // Next cycle keeps working
    h.provider.fail = false;
    h.provider.reply = "recovered";
    h.set_messages("chan", json::array({message_json("3", "carol", "!ai hi"),
                                        message_json("4", "carol", "!ai again")}));
    REQUIRE(h.orchestrator.poll_once() == 1);
    REQUIRE(h.server.sent.back().second == "recovered");
}

TEST_CASE("Orchestrator: closed tool stream ends the loop", "[orchestrator]") {
    Config cfg = test_config();
    MockTransport transport;
    transport.start();      // no responder and nothing queued: output is closed
    MockProvider provider;
    RpcClient rpc(transport);
    Orchestrator orchestrator(cfg, rpc, provider);
    std::atomic<bool> shutdown{false};
    std::ostringstream out;

    REQUIRE_THROWS_AS(orchestrator.run(shutdown, out), StreamClosedError);
    REQUIRE(provider.call_count == 0);
}

TEST_CASE("Orchestrator: real child exiting mid-call propagates StreamClosedError",
          "[orchestrator][transport]") {
    Config cfg = test_config();
    MockProvider provider;
    std::atomic<bool> shutdown{false};
    std::ostringstream out;
    pid_t pid = -1;
    {
        // Reads the first request and exits without answering
        ProcessTransport transport({"/bin/sh", "-c", "read line; exit 0"});
        transport.start();
        pid = transport.pid();
        RpcClient rpc(transport);
        Orchestrator orchestrator(cfg, rpc, provider);

        REQUIRE_THROWS_AS(orchestrator.run(shutdown, out), StreamClosedError);
    }
    REQUIRE(kill(pid, 0) == -1);
}

// ── Filtering and dedup ──────────────────────────────────────────

TEST_CASE("Orchestrator: empty fetch does nothing", "[orchestrator]") {
    Harness h;
    REQUIRE_FALSE(h.orchestrator.process_channel("chan"));
    REQUIRE(h.server.read_calls == 1);
    REQUIRE(h.provider.call_count == 0);
    REQUIRE(h.orchestrator.store().processed_count() == 0);
}

TEST_CASE("Orchestrator: fetch requests the configured window", "[orchestrator]") {
    Harness h;
    h.orchestrator.process_channel("chan");
    auto req = h.transport.written_json(0);
    REQUIRE(req["params"]["name"] == "read_discord_messages");
    REQUIRE(req["params"]["arguments"]["channel_id"] == "chan");
    REQUIRE(req["params"]["arguments"]["limit"] == 100);
}

TEST_CASE("Orchestrator: already answered message is not answered twice", "[orchestrator]") {
    Harness h;
    h.set_messages("chan", json::array({message_json("2", "bob", "!ai question")}));

    REQUIRE(h.orchestrator.poll_once() == 1);
    REQUIRE(h.orchestrator.poll_once() == 0);
    REQUIRE(h.orchestrator.poll_once() == 0);
    REQUIRE(h.provider.call_count == 1);
    REQUIRE(h.server.sent.size() == 1);
}

TEST_CASE("Orchestrator: only the newest message is checked for the trigger", "[orchestrator]") {
    Harness h;
    h.set_messages("chan", json::array({message_json("1", "bob", "!ai old question"),
                                        message_json("2", "alice", "chatter")}));

    REQUIRE_FALSE(h.orchestrator.process_channel("chan"));
    REQUIRE(h.provider.call_count == 0);
    REQUIRE(h.orchestrator.store().is_processed("chan", "2"));
    REQUIRE_FALSE(h.orchestrator.store().is_processed("chan", "1"));
}

TEST_CASE("Orchestrator: window is backfilled into history", "[orchestrator]") {
    Harness h;
    h.set_messages("chan", json::array({message_json("1", "alice", "we met at 3"),
                                        message_json("2", "carol", "and left at 5"),
                                        message_json("3", "bob", "!ai summarize")}));

    REQUIRE(h.orchestrator.process_channel("chan"));

    auto& ctx = h.provider.last_messages;
    REQUIRE(ctx.size() == 4);
    REQUIRE(ctx[1].content == "[alice]: we met at 3");
    REQUIRE(ctx[2].content == "[carol]: and left at 5");
    REQUIRE(ctx[3].content == "[bob]: summarize");
    // Earlier triggered messages keep their prefix; only the newest is stripped
    REQUIRE(h.orchestrator.store().history("chan")[2].content == "summarize");
}

TEST_CASE("Orchestrator: skipped untriggered message never enters the transcript",
          "[orchestrator]") {
    Harness h;
    h.set_messages("chan", json::array({message_json("1", "alice", "hello")}));
    h.orchestrator.poll_once();

    h.set_messages("chan", json::array({message_json("1", "alice", "hello"),
                                        message_json("2", "bob", "!ai hi")}));
    REQUIRE(h.orchestrator.poll_once() == 1);

    auto& ctx = h.provider.last_messages;
    REQUIRE(ctx.size() == 2);
    REQUIRE(ctx[1].content == "[bob]: hi");
}

TEST_CASE("Orchestrator: context grows with every interaction", "[orchestrator]") {
    Harness h;
    json msgs = json::array();
    for (int i = 1; i <= 12; ++i) {
        msgs.push_back(message_json(std::to_string(i), "user", "!ai question " + std::to_string(i)));
        h.set_messages("chan", msgs);
        REQUIRE(h.orchestrator.poll_once() == 1);
        REQUIRE(h.provider.last_messages.size() == 1 + static_cast<size_t>(i));
    }
    REQUIRE(h.orchestrator.store().history_size("chan") == 12);
}

TEST_CASE("Orchestrator: channels keep separate histories", "[orchestrator]") {
    Harness h(test_config({"a", "b"}));
    h.set_messages("a", json::array({message_json("1", "x", "!ai in a")}));
    h.set_messages("b", json::array({message_json("1", "y", "!ai in b")}));

    REQUIRE(h.orchestrator.poll_once() == 2);
    REQUIRE(h.orchestrator.store().history_size("a") == 1);
    REQUIRE(h.orchestrator.store().history_size("b") == 1);
    REQUIRE(h.server.sent[0].first == "a");
    REQUIRE(h.server.sent[1].first == "b");
    REQUIRE(h.provider.last_messages[1].content == "[y]: in b");
}

TEST_CASE("Orchestrator: RPC error on one channel does not stop the others", "[orchestrator]") {
    Harness h(test_config({"bad", "good"}));
    h.server.fail_read["bad"] = "Missing Access";
    h.set_messages("good", json::array({message_json("9", "z", "!ai ping")}));

    REQUIRE(h.orchestrator.poll_once() == 1);
    REQUIRE(h.server.sent.size() == 1);
    REQUIRE(h.server.sent[0].first == "good");
}

TEST_CASE("Orchestrator: malformed tool payload is treated as empty", "[orchestrator]") {
    Config cfg = test_config();
    MockTransport transport;
    transport.start();
    transport.responder = [](const json& req) {
        return std::vector<std::string>{
            tool_text_response(req["id"].get<int64_t>(), "Error: Unknown Channel")};
    };
    MockProvider provider;
    RpcClient rpc(transport);
    Orchestrator orchestrator(cfg, rpc, provider);

    REQUIRE(orchestrator.poll_once() == 0);
    REQUIRE(provider.call_count == 0);
}

// ── Reply delivery ───────────────────────────────────────────────

TEST_CASE("Orchestrator: long reply is split into several messages", "[orchestrator]") {
    Config cfg = test_config();
    cfg.max_message_length = 10;
    Harness h(cfg);
    h.provider.reply = "aaaa bbbb cccc dddd eeee";
    h.set_messages("chan", json::array({message_json("1", "u", "!ai long")}));

    REQUIRE(h.orchestrator.process_channel("chan"));
    REQUIRE(h.server.sent.size() == 3);
    std::string joined;
    for (const auto& s : h.server.sent) {
        REQUIRE(s.second.size() <= 10);
        joined += s.second;
    }
    REQUIRE(joined == "aaaa bbbb cccc dddd eeee");
}

TEST_CASE("Orchestrator: long reply without spaces is split on character boundaries",
          "[orchestrator]") {
    Harness h;
    std::string reply;
    for (int i = 0; i < 700; ++i) reply += "\xE4\xB8\xAD";   // 2100 bytes of U+4E2D
    h.provider.reply = reply;
    h.set_messages("chan", json::array({message_json("1", "u", "!ai \xE7\x94\xA8\xE4\xB8\xAD\xE6\x96\x87")}));

    REQUIRE(h.orchestrator.poll_once() == 1);
    REQUIRE(h.server.sent.size() == 2);
    REQUIRE(h.server.sent[0].second.size() <= 2000);
    REQUIRE(h.server.sent[0].second + h.server.sent[1].second == reply);
}

TEST_CASE("Orchestrator: unexpected failure abandons only that channel", "[orchestrator]") {
    Harness h(test_config({"a", "b"}));
    // Invalid UTF-8 cannot be encoded into the send request
    h.provider.reply = "bad \xFF byte";
    int calls = 0;
    h.provider.on_chat = [&h, &calls]() {
        if (++calls == 2) h.provider.reply = "fine";
    };
    h.set_messages("a", json::array({message_json("1", "x", "!ai first")}));
    h.set_messages("b", json::array({message_json("1", "y", "!ai second")}));

    REQUIRE(h.orchestrator.poll_once() == 1);
    REQUIRE(h.server.sent.size() == 1);
    REQUIRE(h.server.sent[0].first == "b");
    REQUIRE(h.server.sent[0].second == "fine");
    REQUIRE(h.orchestrator.store().is_processed("a", "1"));

    // The failed channel is not retried on the next cycle
    REQUIRE(h.orchestrator.poll_once() == 0);
    REQUIRE(calls == 2);
}

TEST_CASE("Orchestrator: empty reply sends nothing", "[orchestrator]") {
    Harness h;
    h.provider.reply = "";
    h.set_messages("chan", json::array({message_json("1", "u", "!ai")}));

    h.orchestrator.process_channel("chan");
    REQUIRE(h.provider.call_count == 1);
    REQUIRE(h.server.sent.empty());
    REQUIRE(h.orchestrator.store().history("chan")[0].content.empty());
}

// ── Loop control ─────────────────────────────────────────────────

TEST_CASE("Orchestrator: run polls until shutdown is raised", "[orchestrator]") {
    Harness h;
    std::atomic<bool> shutdown{false};
    h.provider.on_chat = [&shutdown]() { shutdown.store(true); };
    h.set_messages("chan", json::array({message_json("1", "u", "!ai stop after this")}));

    std::ostringstream out;
    h.orchestrator.run(shutdown, out);

    REQUIRE(h.server.sent.size() == 1);
    REQUIRE(out.str().empty());
}

TEST_CASE("Orchestrator: shutdown during generation skips the reply", "[orchestrator]") {
    std::atomic<bool> shutdown{false};
    Harness h(test_config(), &shutdown);
    h.provider.on_chat = [&shutdown]() { shutdown.store(true); };
    h.set_messages("chan", json::array({message_json("1", "u", "!ai slow")}));

    REQUIRE_THROWS_AS(h.orchestrator.process_channel("chan"), CancelledError);
    REQUIRE(h.server.sent.empty());
}

TEST_CASE("Orchestrator: no channels lists visible channels and returns", "[orchestrator]") {
    Harness h(test_config({}));
    h.server.channels = json::array({
        {{"id", "10"}, {"name", "general"}, {"guild", "Home"}, {"type", 0}}
    });
    std::atomic<bool> shutdown{false};
    std::ostringstream out;

    h.orchestrator.run(shutdown, out);

    REQUIRE(out.str().find("general (ID: 10) in Home") != std::string::npos);
    REQUIRE(out.str().find("MONITORED_CHANNEL_IDS") != std::string::npos);
    REQUIRE(h.server.read_calls == 0);
    REQUIRE(h.transport.written.size() == 1);
}
