#include <benchmark/benchmark.h>
#include "collab/core/ConnectionRegistry.hpp"
#include "collab/core/ConnectionSink.hpp"
#include "collab/core/RoomBroadcaster.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace {

class NullSink final : public collab::core::ConnectionSink {
public:
    void sendText(std::string frame) override { bytes.fetch_add(frame.size(), std::memory_order_relaxed); }
    void close() override {}
    std::atomic<std::size_t> bytes{0};
};

} // namespace

static void BM_RoomBroadcast(benchmark::State& state) {
    collab::core::ConnectionRegistry registry;
    collab::core::RoomBroadcaster broadcaster(&registry);

    const int members = static_cast<int>(state.range(0));
    for (int i = 0; i < members; ++i) {
        const std::string user = "user" + std::to_string(i);
        const auto id = static_cast<collab::ConnId>(i + 1);
        registry.registerConnection(user, id, std::make_shared<NullSink>());
        registry.joinWorkspace(user, id, "ws1", collab::WorkspaceRole::Editor);
    }

    const std::string frame = R"({"event":"order_edit","data":{"orderId":"o1","version":4}})";
    for (auto _ : state) {
        benchmark::DoNotOptimize(broadcaster.broadcast("ws1", frame, std::string("user0")));
    }
    state.SetItemsProcessed(state.iterations() * (members - 1));
}

BENCHMARK(BM_RoomBroadcast)->Arg(2)->Arg(16)->Arg(128)->Arg(1024)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
