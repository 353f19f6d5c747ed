#include "collab/util/Metrics.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace collab::util;

TEST(MetricsTest, CountersAccumulateAcrossThreads) {
    auto& m = MetricRegistry::instance();
    const double before = m.counter("test.metrics.hits");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([]{
            for (int i = 0; i < 100; ++i) COLLAB_METRIC_HIT("test.metrics.hits");
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_DOUBLE_EQ(m.counter("test.metrics.hits") - before, 400.0);
}

TEST(MetricsTest, GaugeKeepsLastValue) {
    COLLAB_METRIC_SET("test.metrics.gauge", 3.0);
    COLLAB_METRIC_SET("test.metrics.gauge", 7.0);
    auto g = MetricRegistry::instance().snapshotGauges();
    ASSERT_TRUE(g.count("test.metrics.gauge"));
    EXPECT_DOUBLE_EQ(g["test.metrics.gauge"], 7.0);
}

TEST(MetricsTest, ReporterStartsAndStops) {
    auto& m = MetricRegistry::instance();
    m.startReporter(1);
    m.stopReporter();
    m.stopReporter();
    SUCCEED();
}
