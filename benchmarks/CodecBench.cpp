#include <benchmark/benchmark.h>
#include "collab/protocol/Codec.hpp"
#include <chrono>
#include <string>

static void BM_DecodeOrderEdit(benchmark::State& state) {
    const std::string frame =
        R"({"event":"order_edit","data":{"orderId":"o1","workspaceId":"ws1",)"
        R"("fieldPath":"lines.3.quantity","oldValue":4,"newValue":{"qty":5,"unit":"box"},"version":12}})";
    for (auto _ : state) {
        auto r = collab::protocol::decode(frame);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_DecodeOrderEdit)->Unit(benchmark::kNanosecond);

static void BM_EncodeEdit(benchmark::State& state) {
    collab::EditRecord e;
    e.editId = "edit-42";
    e.orderId = "o1";
    e.workspaceId = "ws1";
    e.userId = "alice";
    e.fieldPath = "lines.3.quantity";
    e.oldValue = "4";
    e.newValue = R"({"qty":5,"unit":"box"})";
    e.version = 13;
    e.timestamp = std::chrono::system_clock::now();
    for (auto _ : state) {
        benchmark::DoNotOptimize(collab::protocol::encodeEdit(e));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_EncodeEdit)->Unit(benchmark::kNanosecond);

static void BM_EncodeWorkspaceState(benchmark::State& state) {
    collab::WorkspaceSnapshot s;
    s.workspaceId = "ws1";
    s.timestamp = std::chrono::system_clock::now();
    for (int i = 0; i < state.range(0); ++i) {
        collab::PresenceRecord p;
        p.userId = "user" + std::to_string(i);
        p.workspaceId = "ws1";
        p.status = collab::PresenceStatus::Online;
        p.lastActivity = s.timestamp;
        s.members.push_back(p);
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(collab::protocol::encodeWorkspaceState(s));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_EncodeWorkspaceState)->Arg(8)->Arg(64)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
