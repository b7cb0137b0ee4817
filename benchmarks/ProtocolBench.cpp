#include <benchmark/benchmark.h>
#include "kspec/ws/Protocol.hpp"
#include <string>

static void BM_DecodeSubscribe(benchmark::State& state) {
    const std::string text =
        R"({"action":"subscribe","request_id":"01HZX3","payload":{"topics":["tasks","inbox","files:updates"]}})";
    for (auto _ : state) {
        auto r = kspec::ws::decodeCommand(text);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_DecodeSubscribe);

static void BM_EncodeBroadcast(benchmark::State& state) {
    kspec::ws::BroadcastEvent ev;
    ev.msgId = "01HZX3KQ0000000000000000AB";
    ev.seq = 17;
    ev.timestamp = "2024-01-01T00:00:00.000Z";
    ev.topic = "tasks";
    ev.event = "task_updated";
    ev.data = R"({"id":42,"status":"done"})";
    for (auto _ : state) {
        benchmark::DoNotOptimize(kspec::ws::encodeBroadcast(ev));
    }
}
BENCHMARK(BM_EncodeBroadcast);

static void BM_DecodeBroadcastFrame(benchmark::State& state) {
    const std::string text =
        R"({"msg_id":"m","seq":9,"timestamp":"x","topic":"tasks","event":"e","data":{"k":[1,2,3]}})";
    for (auto _ : state) {
        auto f = kspec::ws::decodeServerFrame(text);
        benchmark::DoNotOptimize(f);
    }
}
BENCHMARK(BM_DecodeBroadcastFrame);

BENCHMARK_MAIN();
