#include "kspec/client/ClientConnection.hpp"
#include "kspec/client/WebSocketManager.hpp"
#include "kspec/server/CommandHandler.hpp"
#include "kspec/server/ConnectionRegistry.hpp"
#include "kspec/server/HeartbeatManager.hpp"
#include "kspec/server/WebSocketServer.hpp"
#include "kspec/ws/Protocol.hpp"
#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <rapidjson/document.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace kspec;
using namespace kspec::server;
using tcp = boost::asio::ip::tcp;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using namespace std::chrono;

namespace {

bool waitFor(const std::function<bool()>& pred, milliseconds timeout = milliseconds(3000)) {
    const auto deadline = steady_clock::now() + timeout;
    while (steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(5));
    }
    return pred();
}

// Blocking WebSocket client for driving the daemon frame by frame.
struct SyncClient {
    boost::asio::io_context ioc;
    websocket::stream<tcp::socket> ws{ioc};

    void connect(unsigned short port, const std::string& target = "/ws") {
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve("127.0.0.1", std::to_string(port));
        boost::asio::connect(ws.next_layer(), results.begin(), results.end());
        ws.handshake("127.0.0.1:" + std::to_string(port), target);
    }

    std::string read() {
        beast::flat_buffer buffer;
        ws.read(buffer);
        return beast::buffers_to_string(buffer.data());
    }

    void write(const std::string& text) {
        ws.text(true);
        ws.write(boost::asio::buffer(text));
    }
};

template <typename T>
T frameAs(const std::string& text) {
    auto f = ws::decodeServerFrame(text);
    EXPECT_TRUE(f) << text;
    if (!f || !std::holds_alternative<T>(*f)) {
        ADD_FAILURE() << "unexpected frame " << text;
        return T{};
    }
    return std::get<T>(*f);
}

} // namespace

struct LoopbackFixture : public ::testing::Test {
    boost::asio::io_context ioc;
    ConnectionRegistry registry;
    CommandHandler commands{registry};
    HeartbeatManager heartbeat{ioc, seconds(30), seconds(90)};
    std::unique_ptr<WebSocketServer> server;
    std::thread runner;
    unsigned short port = 0;

    void SetUp() override {
        server = std::make_unique<WebSocketServer>(
            ioc, registry, commands, heartbeat,
            tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        auto started = server->run();
        ASSERT_TRUE(started) << started.error().describe();
        port = server->port();
        ASSERT_NE(port, 0);
        heartbeat.start(registry);
        runner = std::thread([this] { ioc.run(); });
    }

    void TearDown() override {
        if (runner.joinable()) {
            // The acceptor belongs to the io thread.
            std::promise<void> done;
            boost::asio::post(ioc, [this, &done] {
                server->shutdown();
                done.set_value();
            });
            done.get_future().wait_for(seconds(2));
            ioc.stop();
            runner.join();
        }
    }

    http::response<http::string_body> get(const std::string& target, const std::string& host) {
        boost::asio::io_context cioc;
        tcp::socket sock(cioc);
        sock.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, host);
        http::write(sock, req);
        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(sock, buffer, res);
        return res;
    }

    std::string local() const { return "127.0.0.1:" + std::to_string(port); }
};

TEST_F(LoopbackFixture, HealthReportsConnections) {
    auto res = get("/api/health", local());
    EXPECT_EQ(res.result(), http::status::ok);
    rapidjson::Document d;
    d.Parse(res.body().c_str());
    ASSERT_TRUE(d.IsObject());
    EXPECT_STREQ(d["status"].GetString(), "ok");
    EXPECT_EQ(d["connections"].GetUint64(), 0u);
    EXPECT_STREQ(d["version"].GetString(), WebSocketServer::kVersion);

    SyncClient c;
    c.connect(port);
    c.read();
    ASSERT_TRUE(waitFor([&] { return registry.connectionCount() == 1; }));
    auto res2 = get("/api/health", local());
    rapidjson::Document d2;
    d2.Parse(res2.body().c_str());
    EXPECT_EQ(d2["connections"].GetUint64(), 1u);
}

TEST_F(LoopbackFixture, RejectsForeignHost) {
    auto res = get("/api/health", "example.com");
    EXPECT_EQ(res.result(), http::status::forbidden);
    EXPECT_NE(res.body().find("Forbidden"), std::string::npos);
}

TEST_F(LoopbackFixture, UnknownRoutesAre404) {
    EXPECT_EQ(get("/nope", local()).result(), http::status::not_found);

    SyncClient c;
    EXPECT_THROW(c.connect(port, "/elsewhere"), boost::system::system_error);
    EXPECT_EQ(registry.connectionCount(), 0u);
}

TEST_F(LoopbackFixture, GreetingSubscribeAndBroadcast) {
    SyncClient c;
    c.connect(port);
    auto hello = frameAs<ws::ConnectedEvent>(c.read());
    EXPECT_EQ(hello.sessionId.size(), 26u);

    c.write(ws::encodeCommand(ws::Action::Subscribe, std::string("r1"), {"tasks"}));
    auto ack = frameAs<ws::CommandAck>(c.read());
    EXPECT_TRUE(ack.success);
    EXPECT_EQ(ack.requestId.value_or(""), "r1");

    EXPECT_EQ(registry.broadcastRaw("tasks", "task_updated", R"({"id":1})"), 1u);
    EXPECT_EQ(registry.broadcastRaw("items", "item_updated", R"({"id":1})"), 0u);
    EXPECT_EQ(registry.broadcastRaw("tasks", "task_updated", R"({"id":2})"), 1u);

    auto e0 = frameAs<ws::BroadcastEvent>(c.read());
    auto e1 = frameAs<ws::BroadcastEvent>(c.read());
    EXPECT_EQ(e0.seq, 0u);
    EXPECT_EQ(e1.seq, 1u);
    EXPECT_EQ(e0.topic, "tasks");
    EXPECT_EQ(e1.data, R"({"id":2})");
}

TEST_F(LoopbackFixture, BadCommandGetsFailedAckAndConnectionStays) {
    SyncClient c;
    c.connect(port);
    c.read();

    c.write("this is not json");
    auto bad = frameAs<ws::CommandAck>(c.read());
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.error, kErrInvalidPayload);

    c.write(R"({"action":"ping","request_id":"p"})");
    auto pong = frameAs<ws::CommandAck>(c.read());
    EXPECT_TRUE(pong.success);
    EXPECT_EQ(registry.connectionCount(), 1u);
}

TEST_F(LoopbackFixture, ProjectBindingFromQuery) {
    SyncClient c;
    c.connect(port, "/ws?project=%2Ftmp%2Falpha");
    c.read();
    c.write(ws::encodeCommand(ws::Action::Subscribe, std::string("r"), {"files:updates"}));
    c.read();

    EXPECT_EQ(registry.broadcastRaw("files:updates", "changed", "{}", std::string("/tmp/beta")), 0u);
    EXPECT_EQ(registry.broadcastRaw("files:updates", "changed", "{}", std::string("/tmp/alpha")), 1u);
    auto ev = frameAs<ws::BroadcastEvent>(c.read());
    EXPECT_EQ(ev.seq, 0u);
}

TEST_F(LoopbackFixture, ShutdownClosesNormally) {
    SyncClient c;
    c.connect(port);
    c.read();
    ASSERT_TRUE(waitFor([&] { return registry.connectionCount() == 1; }));

    server->closeAll();

    beast::flat_buffer buffer;
    beast::error_code ec;
    c.ws.read(buffer, ec);
    EXPECT_EQ(ec, websocket::error::closed);
    EXPECT_EQ(c.ws.reason().code, websocket::close_code::normal);
    EXPECT_EQ(registry.connectionCount(), 0u);
}

TEST_F(LoopbackFixture, HeartbeatEvictsSilentPeer) {
    SyncClient c;
    c.connect(port);
    c.read();
    ASSERT_TRUE(waitFor([&] { return registry.connectionCount() == 1; }));

    // Pretend the peer has been silent past the pong timeout.
    EXPECT_EQ(heartbeat.tick(ConnectionRegistry::Clock::now() + seconds(91)), 1u);

    beast::flat_buffer buffer;
    beast::error_code ec;
    c.ws.read(buffer, ec);
    EXPECT_EQ(ec, websocket::error::closed);
    EXPECT_EQ(c.ws.reason().code, websocket::close_code::going_away);
    EXPECT_EQ(registry.connectionCount(), 0u);
}

TEST_F(LoopbackFixture, PeerVanishingMidWriteLeavesServerHealthy) {
    {
        SyncClient c;
        c.connect(port);
        c.read();
        c.write(ws::encodeCommand(ws::Action::Subscribe, std::string("r"), {"tasks"}));
        c.read();

        const std::string blob = R"({"blob":")" + std::string(64 * 1024, 'x') + R"("})";
        for (int i = 0; i < 32; ++i) registry.broadcastRaw("tasks", "bulk", blob);

        // No close handshake: the server finds out through a failed read or write.
        beast::error_code ignored;
        c.ws.next_layer().shutdown(tcp::socket::shutdown_both, ignored);
        c.ws.next_layer().close(ignored);
    }
    ASSERT_TRUE(waitFor([&] { return registry.connectionCount() == 0; }));

    SyncClient fresh;
    fresh.connect(port);
    fresh.read();
    fresh.write(ws::encodeCommand(ws::Action::Subscribe, std::string("r"), {"tasks"}));
    EXPECT_TRUE(frameAs<ws::CommandAck>(fresh.read()).success);
    EXPECT_EQ(registry.broadcastRaw("tasks", "task_updated", R"({"id":1})"), 1u);
    EXPECT_EQ(frameAs<ws::BroadcastEvent>(fresh.read()).seq, 0u);
}

TEST_F(LoopbackFixture, ClientConnectionClosesOnceWithWritesQueued) {
    boost::asio::io_context cioc;
    auto work = boost::asio::make_work_guard(cioc);
    auto conn = client::ClientConnection::create(cioc, "127.0.0.1", std::to_string(port), "/ws");

    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
    conn->setOnOpen([&] {
        ++opens;
        for (int i = 0; i < 200; ++i) {
            conn->send(ws::encodeCommand(ws::Action::Ping, "p" + std::to_string(i)));
        }
    });
    conn->setOnClose([&] { ++closes; });
    conn->connect();
    std::thread clientThread([&] { cioc.run(); });

    ASSERT_TRUE(waitFor([&] { return opens.load() == 1 && registry.connectionCount() == 1; }));
    server->closeAll();
    EXPECT_TRUE(waitFor([&] { return closes.load() == 1; }));
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(closes.load(), 1);

    work.reset();
    cioc.stop();
    clientThread.join();
}

TEST_F(LoopbackFixture, ManagerReconnectsAndResubscribes) {
    boost::asio::io_context cioc;
    auto work = boost::asio::make_work_guard(cioc);
    auto mgr = client::WebSocketManager::create(cioc, "127.0.0.1", std::to_string(port));

    std::mutex mu;
    std::vector<ws::BroadcastEvent> got;
    mgr->on("tasks", [&](const ws::BroadcastEvent& ev) {
        std::lock_guard<std::mutex> lk(mu);
        got.push_back(ev);
    });
    auto count = [&] {
        std::lock_guard<std::mutex> lk(mu);
        return got.size();
    };
    auto subscribedSession = [&](const std::string& exclude) -> std::string {
        for (const auto& id : registry.sessionIds()) {
            if (id == exclude) continue;
            auto topics = registry.topicsOf(id).value_or(std::set<std::string>{});
            if (topics.count("tasks")) return id;
        }
        return {};
    };

    mgr->subscribe({"tasks"});
    mgr->connect();
    std::thread clientThread([&] { cioc.run(); });

    std::string first;
    ASSERT_TRUE(waitFor([&] { first = subscribedSession(""); return !first.empty(); }));
    registry.broadcastRaw("tasks", "task_updated", R"({"id":1})");
    registry.broadcastRaw("tasks", "task_updated", R"({"id":2})");
    ASSERT_TRUE(waitFor([&] { return count() == 2; }));
    ASSERT_TRUE(waitFor([&] { return mgr->lastSeqProcessed() == 1; }));
    EXPECT_EQ(mgr->status(), client::ConnectionStatus::Connected);

    // Drop every connection; the manager comes back after the 1 s backoff.
    registry.closeAll(ws::kCloseNormal, "Server shutting down");
    std::string second;
    ASSERT_TRUE(waitFor([&] { second = subscribedSession(first); return !second.empty(); },
                        milliseconds(5000)));
    EXPECT_NE(first, second);

    registry.broadcastRaw("tasks", "task_updated", R"({"id":3})");
    ASSERT_TRUE(waitFor([&] { return count() == 3; }));
    {
        std::lock_guard<std::mutex> lk(mu);
        EXPECT_EQ(got[0].seq, 0u);
        EXPECT_EQ(got[1].seq, 1u);
        EXPECT_EQ(got[2].seq, 0u);
    }
    EXPECT_TRUE(waitFor([&] { return mgr->stats().connectCount == 2; }));

    mgr->disconnect();
    EXPECT_TRUE(waitFor([&] { return mgr->status() == client::ConnectionStatus::Disconnected; }));
    EXPECT_TRUE(waitFor([&] { return registry.connectionCount() == 0; }));

    work.reset();
    cioc.stop();
    clientThread.join();
}
