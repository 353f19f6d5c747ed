#include "collab/core/HeartbeatSweeper.hpp"
#include "support/TestSupport.hpp"
#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <thread>

using namespace collab;
using namespace collab::core;
using namespace collab::test;

TEST(HeartbeatSweeperTest, TickSweepsLocksAndSendsHeartbeat) {
    Harness h;
    h.member("ws1", "alice");
    h.member("ws1", "bob");
    auto a = h.connect("alice");
    auto b = h.connect("bob");
    auto idle = h.connect("carol");
    h.join(a, "ws1");
    h.join(b, "ws1");
    h.locks.requestLock("o1", "alice", "ws1", 1);
    b.sink->clear();

    boost::asio::io_context ioc;
    HeartbeatSweeper sweeper(ioc, &h.locks, &h.presence, &h.broadcaster, &h.clock,
                             HeartbeatSweeper::Options{});
    h.clock.advance(std::chrono::minutes(2));
    sweeper.tick();

    EXPECT_EQ(sweeper.ticks(), 1u);
    EXPECT_FALSE(h.locks.liveLock("o1").has_value());
    EXPECT_FALSE(h.store.orderLock("o1").has_value());
    EXPECT_EQ(b.sink->count("order_unlock"), 1u);
    EXPECT_EQ(b.sink->count("heartbeat"), 1u);
    // Heartbeats go to every connection, joined or not.
    EXPECT_EQ(idle.sink->count("heartbeat"), 1u);
}

TEST(HeartbeatSweeperTest, TickExpiresIdlePresenceOfAbsentUsers) {
    Harness h;
    h.member("ws1", "alice");
    auto a = h.connect("alice");
    h.join(a, "ws1");
    h.presence.update("bob", "ws1", PresenceStatus::Online, std::nullopt, std::nullopt);

    boost::asio::io_context ioc;
    HeartbeatSweeper::Options opts;
    opts.inactiveAfter = std::chrono::hours(1);
    HeartbeatSweeper sweeper(ioc, &h.locks, &h.presence, &h.broadcaster, &h.clock, opts);
    h.clock.advance(std::chrono::hours(2));
    sweeper.tick();

    EXPECT_EQ(h.store.presence("bob", "ws1")->status, PresenceStatus::Offline);
    EXPECT_EQ(h.store.presence("alice", "ws1")->status, PresenceStatus::Online);
    EXPECT_EQ(h.presence.cacheSize(), 1u);
}

TEST(HeartbeatSweeperTest, TimerDrivesTicksUntilStopped) {
    Harness h;
    boost::asio::io_context ioc;
    HeartbeatSweeper::Options opts;
    opts.interval = std::chrono::seconds(1);
    HeartbeatSweeper sweeper(ioc, &h.locks, &h.presence, &h.broadcaster, &h.clock, opts);
    sweeper.start();
    sweeper.start();

    boost::asio::steady_timer deadline(ioc, std::chrono::milliseconds(2500));
    deadline.async_wait([&](const boost::system::error_code&) { sweeper.stop(); });
    ioc.run();

    EXPECT_GE(sweeper.ticks(), 2u);
    const auto after = sweeper.ticks();
    sweeper.stop();
    EXPECT_EQ(sweeper.ticks(), after);
}
