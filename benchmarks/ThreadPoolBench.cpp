#include <benchmark/benchmark.h>
#include "collab/rt/SerialMailbox.hpp"
#include "collab/rt/ThreadPool.hpp"
#include <atomic>
#include <memory>
#include <vector>

static void BM_ThreadPoolPost(benchmark::State& state) {
    collab::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));
    std::atomic<int> counter{0};

    for (auto _ : state) {
        pool.post([&counter]() { counter.fetch_add(1, std::memory_order_relaxed); });
    }
    pool.drain();
    pool.shutdown();

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_ThreadPoolPost)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kNanosecond);

static void BM_ThreadPoolPostAndDrain(benchmark::State& state) {
    collab::rt::ThreadPool pool(static_cast<unsigned>(state.range(0)));
    std::atomic<int> counter{0};

    for (auto _ : state) {
        for (int i = 0; i < 100; ++i) {
            pool.post([&counter]() { counter.fetch_add(1, std::memory_order_relaxed); });
        }
        pool.drain();
    }
    pool.shutdown();

    state.SetItemsProcessed(state.iterations() * 100);
}

BENCHMARK(BM_ThreadPoolPostAndDrain)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMicrosecond);

// Per-connection mailboxes sharing one pool, as the hub runs them.
static void BM_MailboxFanIn(benchmark::State& state) {
    collab::rt::ThreadPool pool(4);
    const int boxes = static_cast<int>(state.range(0));
    std::vector<std::shared_ptr<collab::rt::SerialMailbox>> mailboxes;
    for (int i = 0; i < boxes; ++i) mailboxes.push_back(collab::rt::SerialMailbox::create(&pool));
    std::atomic<int> counter{0};

    for (auto _ : state) {
        for (auto& m : mailboxes) {
            for (int i = 0; i < 10; ++i) {
                m->post([&counter]() { counter.fetch_add(1, std::memory_order_relaxed); });
            }
        }
        pool.drain();
    }
    pool.shutdown();

    state.SetItemsProcessed(state.iterations() * boxes * 10);
}

BENCHMARK(BM_MailboxFanIn)->Arg(1)->Arg(16)->Arg(128)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
