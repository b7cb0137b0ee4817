#include <benchmark/benchmark.h>
#include "kspec/server/ConnectionRegistry.hpp"
#include "kspec/server/IConnection.hpp"
#include <rapidjson/document.h>
#include <atomic>
#include <memory>
#include <string>

namespace {

class NullConnection final : public kspec::server::IConnection {
public:
    explicit NullConnection(std::string id) : id_(std::move(id)) {}
    const std::string& sessionId() const override { return id_; }
    void sendText(std::string text) override { bytes_ += text.size(); }
    std::size_t bufferedAmount() const override { return 0; }
    void ping() override {}
    void close(std::uint16_t, std::string) override {}

private:
    std::string id_;
    std::atomic<std::size_t> bytes_{0};
};

static void populate(kspec::server::ConnectionRegistry& reg, int n) {
    for (int i = 0; i < n; ++i) {
        const std::string id = "bench-" + std::to_string(i);
        reg.addConnection(std::make_shared<NullConnection>(id));
        reg.subscribe(id, {"tasks"});
    }
}

} // namespace

static void BM_BroadcastRawFanOut(benchmark::State& state) {
    kspec::server::ConnectionRegistry reg;
    populate(reg, static_cast<int>(state.range(0)));

    for (auto _ : state) {
        benchmark::DoNotOptimize(reg.broadcastRaw("tasks", "task_updated", R"({"id":42,"status":"done"})"));
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_BroadcastRawFanOut)->Arg(1)->Arg(16)->Arg(256)->Unit(benchmark::kMicrosecond);

static void BM_BroadcastDocument(benchmark::State& state) {
    kspec::server::ConnectionRegistry reg;
    populate(reg, 16);

    rapidjson::Document data;
    data.Parse(R"({"id":42,"status":"done","tags":["a","b","c"]})");

    for (auto _ : state) {
        benchmark::DoNotOptimize(reg.broadcast("tasks", "task_updated", data));
    }
    state.SetItemsProcessed(state.iterations() * 16);
}
BENCHMARK(BM_BroadcastDocument)->Unit(benchmark::kMicrosecond);

static kspec::server::ConnectionRegistry& sharedRegistry() {
    static kspec::server::ConnectionRegistry reg;
    static const bool populated = (populate(reg, 32), true);
    (void)populated;
    return reg;
}

static void BM_BroadcastContended(benchmark::State& state) {
    auto& reg = sharedRegistry();
    for (auto _ : state) {
        benchmark::DoNotOptimize(reg.broadcastRaw("tasks", "e", "{}"));
    }
}
BENCHMARK(BM_BroadcastContended)->Threads(1)->Threads(2)->Threads(4);

BENCHMARK_MAIN();
