#include <benchmark/benchmark.h>
#include "collab/core/ConnectionRegistry.hpp"
#include "collab/core/LockManager.hpp"
#include "collab/core/RoomBroadcaster.hpp"
#include "collab/store/InMemoryStore.hpp"
#include <string>
#include <vector>

static void BM_LockGrantRelease(benchmark::State& state) {
    collab::store::InMemoryStore store;
    collab::core::ConnectionRegistry registry;
    collab::core::RoomBroadcaster broadcaster(&registry);
    collab::core::LockManager locks(&store, &broadcaster, nullptr);

    std::vector<std::string> orders;
    for (int i = 0; i < 256; ++i) orders.push_back("order-" + std::to_string(i));

    std::size_t i = 0;
    for (auto _ : state) {
        const auto& id = orders[i++ % orders.size()];
        benchmark::DoNotOptimize(locks.requestLock(id, "alice", "ws1"));
        locks.releaseLock(id, "alice", "ws1");
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_LockGrantRelease)->Unit(benchmark::kMicrosecond);

// All threads hammer a small set of orders; most requests are contention replies.
static void BM_LockContention(benchmark::State& state) {
    static collab::store::InMemoryStore store;
    static collab::core::ConnectionRegistry registry;
    static collab::core::RoomBroadcaster broadcaster(&registry);
    static collab::core::LockManager locks(&store, &broadcaster, nullptr);

    const std::string user = "user" + std::to_string(state.thread_index());
    int n = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(locks.requestLock("hot-" + std::to_string(n++ % 4), user, "ws1"));
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_LockContention)->Threads(1)->Threads(4)->Threads(8)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
