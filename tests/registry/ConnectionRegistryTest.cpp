#include "kspec/server/ConnectionRegistry.hpp"
#include "kspec/util/Metrics.hpp"
#include "kspec/ws/Protocol.hpp"
#include "../support/FakeConnection.hpp"
#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace kspec;
using namespace kspec::server;
using kspec::test::FakeConnection;

namespace {

rapidjson::Document payload(const char* json) {
    rapidjson::Document d;
    d.Parse(json);
    return d;
}

ws::BroadcastEvent decodeEvent(const std::string& text) {
    auto f = ws::decodeServerFrame(text);
    EXPECT_TRUE(f);
    if (!f || !std::holds_alternative<ws::BroadcastEvent>(*f)) return {};
    return std::get<ws::BroadcastEvent>(*f);
}

} // namespace

class ConnectionRegistryTest : public ::testing::Test {
protected:
    ConnectionRegistry reg;

    std::shared_ptr<FakeConnection> add(const std::string& id,
                                        std::optional<std::string> project = std::nullopt) {
        auto c = std::make_shared<FakeConnection>(id);
        EXPECT_TRUE(reg.addConnection(c, std::move(project)));
        return c;
    }
};

TEST_F(ConnectionRegistryTest, AddStartsEmptyAtSequenceZero) {
    add("s1");
    EXPECT_EQ(reg.connectionCount(), 1u);
    ASSERT_TRUE(reg.topicsOf("s1").has_value());
    EXPECT_TRUE(reg.topicsOf("s1")->empty());
    EXPECT_EQ(reg.outSeqOf("s1").value(), 0u);
}

TEST_F(ConnectionRegistryTest, DuplicateSessionIdRejected) {
    add("s1");
    auto again = std::make_shared<FakeConnection>("s1");
    auto r = reg.addConnection(again);
    EXPECT_FALSE(r);
    EXPECT_EQ(reg.connectionCount(), 1u);
}

TEST_F(ConnectionRegistryTest, RemoveIsIdempotent) {
    add("s1");
    reg.removeConnection("s1");
    EXPECT_EQ(reg.connectionCount(), 0u);
    EXPECT_NO_THROW(reg.removeConnection("s1"));
    EXPECT_NO_THROW(reg.removeConnection("never"));
    EXPECT_FALSE(reg.subscribe("s1", {"tasks"}));
}

TEST_F(ConnectionRegistryTest, SubscribeIsIdempotentSetUnion) {
    add("s1");
    EXPECT_TRUE(reg.subscribe("s1", {"tasks", "inbox"}));
    EXPECT_TRUE(reg.subscribe("s1", {"tasks"}));
    EXPECT_EQ(reg.topicsOf("s1")->size(), 2u);
    EXPECT_TRUE(reg.unsubscribe("s1", {"tasks", "never-subscribed"}));
    EXPECT_EQ(reg.topicsOf("s1")->size(), 1u);
    EXPECT_EQ(reg.topicsOf("s1")->count("inbox"), 1u);
}

TEST_F(ConnectionRegistryTest, UnknownSessionCannotSubscribe) {
    EXPECT_FALSE(reg.subscribe("ghost", {"tasks"}));
    EXPECT_FALSE(reg.unsubscribe("ghost", {"tasks"}));
}

TEST_F(ConnectionRegistryTest, SequenceStartsAtZeroAndSkipsOtherTopics) {
    auto s1 = add("s1");
    reg.subscribe("s1", {"tasks"});

    auto data = payload(R"({"id":1})");
    EXPECT_EQ(reg.broadcast("tasks", "task_updated", data), 1u);
    EXPECT_EQ(reg.broadcast("tasks", "task_updated", data), 1u);
    EXPECT_EQ(reg.broadcast("items", "item_updated", data), 0u);

    auto sent = s1->sent();
    ASSERT_EQ(sent.size(), 2u);
    auto e0 = decodeEvent(sent[0]);
    auto e1 = decodeEvent(sent[1]);
    EXPECT_EQ(e0.seq, 0u);
    EXPECT_EQ(e1.seq, 1u);
    EXPECT_EQ(e0.topic, "tasks");
    EXPECT_EQ(e0.event, "task_updated");
    EXPECT_EQ(e0.data, R"({"id":1})");
    EXPECT_NE(e0.msgId, e1.msgId);
    EXPECT_EQ(reg.outSeqOf("s1").value(), 2u);
}

TEST_F(ConnectionRegistryTest, OneMessageIdPerLogicalEvent) {
    auto a = add("a");
    auto b = add("b");
    reg.subscribe("a", {"tasks"});
    reg.subscribe("b", {"tasks"});
    // Different starting sequences.
    reg.subscribe("b", {"warmup"});
    reg.broadcastRaw("warmup", "x", "{}");

    EXPECT_EQ(reg.broadcastRaw("tasks", "task_created", R"({"id":7})"), 2u);
    auto ea = decodeEvent(a->lastSent());
    auto eb = decodeEvent(b->lastSent());
    EXPECT_EQ(ea.msgId, eb.msgId);
    EXPECT_EQ(ea.timestamp, eb.timestamp);
    EXPECT_EQ(ea.seq, 0u);
    EXPECT_EQ(eb.seq, 1u);
}

TEST_F(ConnectionRegistryTest, BackpressureDropsWithoutConsumingSequence) {
    auto slow = add("slow");
    auto fast = add("fast");
    reg.subscribe("slow", {"tasks"});
    reg.subscribe("fast", {"tasks"});

    const double droppedBefore = util::MetricRegistry::instance().counter("kspec.broadcast.dropped");

    slow->setBuffered(reg.backpressureBytes());
    EXPECT_EQ(reg.broadcastRaw("tasks", "e", "{}"), 1u);
    EXPECT_TRUE(slow->sent().empty());
    EXPECT_EQ(fast->sent().size(), 1u);
    EXPECT_EQ(reg.outSeqOf("slow").value(), 0u);
    EXPECT_EQ(util::MetricRegistry::instance().counter("kspec.broadcast.dropped"), droppedBefore + 1);

    slow->setBuffered(reg.backpressureBytes() - 1);
    EXPECT_EQ(reg.broadcastRaw("tasks", "e", "{}"), 2u);
    ASSERT_EQ(slow->sent().size(), 1u);
    EXPECT_EQ(decodeEvent(slow->lastSent()).seq, 0u);
    EXPECT_EQ(decodeEvent(fast->lastSent()).seq, 1u);
}

TEST_F(ConnectionRegistryTest, ThresholdIsConfigurable) {
    ConnectionRegistry small(16);
    auto c = std::make_shared<FakeConnection>("c");
    ASSERT_TRUE(small.addConnection(c));
    small.subscribe("c", {"t"});
    c->setBuffered(16);
    EXPECT_EQ(small.broadcastRaw("t", "e", "{}"), 0u);
    c->setBuffered(15);
    EXPECT_EQ(small.broadcastRaw("t", "e", "{}"), 1u);
}

TEST_F(ConnectionRegistryTest, MultiLinePayloadIsCompacted) {
    auto s1 = add("s1");
    reg.subscribe("s1", {"tasks"});

    EXPECT_EQ(reg.broadcastRaw("tasks", "task_updated", "{\n  \"id\": 1,\n  \"tags\": [ \"a\" ]\n}\n"), 1u);
    const auto frame = s1->lastSent();
    EXPECT_EQ(frame.find('\n'), std::string::npos);
    auto ev = decodeEvent(frame);
    EXPECT_EQ(ev.data, R"({"id":1,"tags":["a"]})");
    EXPECT_EQ(ev.seq, 0u);
}

TEST_F(ConnectionRegistryTest, InvalidPayloadRejectedWithoutConsumingSequence) {
    auto s1 = add("s1");
    reg.subscribe("s1", {"tasks"});
    const double before = util::MetricRegistry::instance().counter("kspec.broadcast.rejected");

    EXPECT_EQ(reg.broadcastRaw("tasks", "task_updated", "oops"), 0u);
    EXPECT_EQ(reg.broadcastRaw("tasks", "task_updated", R"({"id":)"), 0u);
    EXPECT_TRUE(s1->sent().empty());
    EXPECT_EQ(reg.outSeqOf("s1").value(), 0u);
    EXPECT_EQ(util::MetricRegistry::instance().counter("kspec.broadcast.rejected"), before + 2);

    EXPECT_EQ(reg.broadcastRaw("tasks", "task_updated", R"({"id":2})"), 1u);
    EXPECT_EQ(decodeEvent(s1->lastSent()).seq, 0u);
}

TEST_F(ConnectionRegistryTest, EmptyPayloadSentAsNull) {
    auto s1 = add("s1");
    reg.subscribe("s1", {"tasks"});
    EXPECT_EQ(reg.broadcastRaw("tasks", "cleared", ""), 1u);
    EXPECT_EQ(decodeEvent(s1->lastSent()).data, "null");
}

TEST_F(ConnectionRegistryTest, ProjectScopedBroadcast) {
    auto a = add("a", std::string("/work/alpha"));
    auto b = add("b", std::string("/work/beta"));
    auto any = add("any");
    for (const char* id : {"a", "b", "any"}) reg.subscribe(id, {"files:updates"});

    EXPECT_EQ(reg.broadcastRaw("files:updates", "file_changed", "{}", std::string("/work/alpha")), 1u);
    EXPECT_EQ(a->sent().size(), 1u);
    EXPECT_TRUE(b->sent().empty());
    EXPECT_TRUE(any->sent().empty());

    EXPECT_EQ(reg.broadcastRaw("files:updates", "file_changed", "{}"), 3u);
}

TEST_F(ConnectionRegistryTest, RemovedConnectionSkippedByLaterBroadcasts) {
    auto s1 = add("s1");
    reg.subscribe("s1", {"tasks"});
    reg.removeConnection("s1");
    EXPECT_EQ(reg.broadcastRaw("tasks", "e", "{}"), 0u);
    EXPECT_TRUE(s1->sent().empty());
}

TEST_F(ConnectionRegistryTest, PingAllStampsAndPings) {
    auto s1 = add("s1");
    auto s2 = add("s2");
    const auto now = ConnectionRegistry::Clock::now();
    auto pinged = reg.pingAll(now);
    EXPECT_EQ(pinged.size(), 2u);
    EXPECT_EQ(s1->pings(), 1);
    EXPECT_EQ(s2->pings(), 1);
    auto stamped = reg.lastPingSentAt("s1");
    ASSERT_TRUE(stamped.has_value());
    EXPECT_TRUE(*stamped == now);
    EXPECT_FALSE(reg.lastPingSentAt("ghost").has_value());
}

TEST_F(ConnectionRegistryTest, StaleConnectionsUseLastPong) {
    using namespace std::chrono;
    const auto t0 = ConnectionRegistry::Clock::now();
    auto a = std::make_shared<FakeConnection>("a");
    auto b = std::make_shared<FakeConnection>("b");
    ASSERT_TRUE(reg.addConnection(a, std::nullopt, t0));
    ASSERT_TRUE(reg.addConnection(b, std::nullopt, t0));

    EXPECT_TRUE(reg.recordPong("b", t0 + seconds(60)));
    EXPECT_FALSE(reg.recordPong("ghost", t0));

    EXPECT_TRUE(reg.staleConnections(t0 + seconds(90), seconds(90)).empty());
    auto stale = reg.staleConnections(t0 + seconds(91), seconds(90));
    ASSERT_EQ(stale.size(), 1u);
    EXPECT_EQ(stale[0], "a");
}

TEST_F(ConnectionRegistryTest, CloseConnectionRemovesThenCloses) {
    auto s1 = add("s1");
    EXPECT_TRUE(reg.closeConnection("s1", ws::kCloseGoingAway, "Ping timeout"));
    EXPECT_EQ(reg.connectionCount(), 0u);
    EXPECT_EQ(s1->closes(), 1);
    EXPECT_EQ(s1->closeCode(), ws::kCloseGoingAway);
    EXPECT_EQ(s1->closeReason(), "Ping timeout");
    EXPECT_FALSE(reg.closeConnection("s1", ws::kCloseGoingAway, "again"));
}

TEST_F(ConnectionRegistryTest, CloseAllEmptiesRegistry) {
    auto a = add("a");
    auto b = add("b");
    EXPECT_EQ(reg.closeAll(ws::kCloseNormal, "Server shutting down"), 2u);
    EXPECT_EQ(reg.connectionCount(), 0u);
    EXPECT_EQ(a->closeCode(), ws::kCloseNormal);
    EXPECT_EQ(b->closeCode(), ws::kCloseNormal);
    EXPECT_EQ(util::MetricRegistry::instance().gauge("kspec.connections"), 0.0);
}

TEST_F(ConnectionRegistryTest, CloseAllKeepsGaugeForLaterSessions) {
    add("a");
    EXPECT_EQ(reg.closeAll(ws::kCloseNormal, "Server shutting down"), 1u);
    add("late");
    EXPECT_EQ(reg.connectionCount(), 1u);
    EXPECT_EQ(util::MetricRegistry::instance().gauge("kspec.connections"), 1.0);
}

TEST_F(ConnectionRegistryTest, GaugeMatchesCountUnderConcurrentAddAndCloseAll) {
    std::atomic<bool> done{false};
    std::thread adder([&] {
        for (int i = 0; i < 2000; ++i) {
            (void)reg.addConnection(std::make_shared<FakeConnection>("n" + std::to_string(i)));
        }
        done = true;
    });
    while (!done) reg.closeAll(ws::kCloseNormal, "Server shutting down");
    adder.join();
    EXPECT_EQ(util::MetricRegistry::instance().gauge("kspec.connections"),
              static_cast<double>(reg.connectionCount()));
}

TEST_F(ConnectionRegistryTest, ConcurrentBroadcastKeepsSequenceDense) {
    auto s1 = add("s1");
    reg.subscribe("s1", {"tasks"});

    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < kPerThread; ++i) reg.broadcastRaw("tasks", "e", "{}");
        });
    }
    // Churn other connections while broadcasting.
    std::thread churn([this] {
        for (int i = 0; i < 200; ++i) {
            const std::string id = "churn-" + std::to_string(i);
            reg.addConnection(std::make_shared<FakeConnection>(id));
            reg.subscribe(id, {"tasks"});
            reg.removeConnection(id);
        }
    });
    for (auto& th : threads) th.join();
    churn.join();

    auto sent = s1->sent();
    ASSERT_EQ(sent.size(), static_cast<std::size_t>(kThreads * kPerThread));
    std::vector<bool> seen(sent.size(), false);
    for (const auto& text : sent) {
        auto ev = decodeEvent(text);
        ASSERT_LT(ev.seq, seen.size());
        EXPECT_FALSE(seen[ev.seq]) << "duplicate seq " << ev.seq;
        seen[ev.seq] = true;
    }
    EXPECT_EQ(reg.connectionCount(), 1u);
}
