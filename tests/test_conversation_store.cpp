#include <catch2/catch_test_macros.hpp>
#include "conversation_store.hpp"
#include <set>

using namespace mcprelay;

static ChannelMessage msg(const std::string& id, const std::string& author,
                          const std::string& content) {
    ChannelMessage m;
    m.id = id;
    m.author = author;
    m.content = content;
    return m;
}

static std::vector<std::string> ids(const std::vector<ChannelMessage>& history) {
    std::vector<std::string> out;
    for (const auto& m : history) out.push_back(m.id);
    return out;
}

// ── ingest ───────────────────────────────────────────────────────

TEST_CASE("ConversationStore: ingest appends in arrival order", "[store]") {
    ConversationStore store;
    auto added = store.ingest("c1", {msg("3", "a", "x"), msg("1", "b", "y"), msg("2", "c", "z")});
    REQUIRE(added == 3);
    // arrival order, not id order
    REQUIRE(ids(store.history("c1")) == std::vector<std::string>{"3", "1", "2"});
    REQUIRE(store.history("c1")[0].channel == "c1");
}

TEST_CASE("ConversationStore: overlapping windows equal their union", "[store]") {
    std::vector<ChannelMessage> w1 = {msg("1", "a", "m1"), msg("2", "a", "m2"), msg("3", "b", "m3")};
    std::vector<ChannelMessage> w2 = {msg("2", "a", "m2"), msg("3", "b", "m3"), msg("4", "c", "m4")};
    std::vector<ChannelMessage> uni = {msg("1", "a", "m1"), msg("2", "a", "m2"),
                                       msg("3", "b", "m3"), msg("4", "c", "m4")};

    ConversationStore twice;
    twice.ingest("c", w1);
    auto added = twice.ingest("c", w2);
    REQUIRE(added == 1);

    ConversationStore once;
    once.ingest("c", uni);

    REQUIRE(ids(twice.history("c")) == ids(once.history("c")));

    auto stored = ids(twice.history("c"));
    std::set<std::string> unique(stored.begin(), stored.end());
    REQUIRE(unique.size() == stored.size());
}

TEST_CASE("ConversationStore: re-ingesting the same window is a no-op", "[store]") {
    ConversationStore store;
    std::vector<ChannelMessage> w = {msg("1", "a", "hi"), msg("2", "b", "yo")};
    store.ingest("c", w);
    REQUIRE(store.ingest("c", w) == 0);
    REQUIRE(store.history_size("c") == 2);
    REQUIRE(store.processed_count() == 2);
}

TEST_CASE("ConversationStore: same id in different channels is distinct", "[store]") {
    ConversationStore store;
    store.ingest("c1", {msg("7", "a", "one")});
    store.ingest("c2", {msg("7", "b", "two")});
    REQUIRE(store.history_size("c1") == 1);
    REQUIRE(store.history_size("c2") == 1);
    REQUIRE(store.is_processed("c1", "7"));
    REQUIRE(store.is_processed("c2", "7"));
    REQUIRE_FALSE(store.is_processed("c3", "7"));
    REQUIRE(store.channel_count() == 2);
}

// ── mark_processed_without_storing ──────────────────────────────

TEST_CASE("ConversationStore: marked message is never stored later", "[store]") {
    ConversationStore store;
    store.mark_processed_without_storing("c", "1");
    REQUIRE(store.is_processed("c", "1"));
    REQUIRE(store.history_size("c") == 0);

    store.ingest("c", {msg("1", "alice", "hello"), msg("2", "bob", "question")});
    REQUIRE(ids(store.history("c")) == std::vector<std::string>{"2"});
}

// ── build_context ────────────────────────────────────────────────

TEST_CASE("ConversationStore: build_context on unknown channel is system only", "[store]") {
    ConversationStore store;
    auto ctx = store.build_context("nowhere", "be nice");
    REQUIRE(ctx.size() == 1);
    REQUIRE(ctx[0].role == Role::System);
    REQUIRE(ctx[0].content == "be nice");
}

TEST_CASE("ConversationStore: build_context renders attributed lines", "[store]") {
    ConversationStore store;
    store.ingest("c", {msg("1", "alice", "hi"), msg("2", "bob", "what time is it")});
    auto ctx = store.build_context("c", "sys");
    REQUIRE(ctx.size() == 3);
    REQUIRE(ctx[0].role == Role::System);
    REQUIRE(ctx[1].role == Role::User);
    REQUIRE(ctx[1].content == "[alice]: hi");
    REQUIRE(ctx[2].content == "[bob]: what time is it");
}

TEST_CASE("ConversationStore: context is never truncated", "[store]") {
    ConversationStore store;
    size_t total = 0;
    for (int round = 0; round < 30; ++round) {
        std::vector<ChannelMessage> window;
        for (int k = 0; k < 10; ++k) {
            window.push_back(msg(std::to_string(round * 10 + k), "u", "m"));
        }
        total += store.ingest("c", window);
    }
    REQUIRE(total == 300);
    REQUIRE(store.build_context("c", "sys").size() == 1 + 300);
}
