#pragma once

#include "collab/runtime/IStoppable.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>

namespace collab::util { class Clock; }

namespace collab::core {

class LockManager;
class PresenceTracker;
class RoomBroadcaster;

// Periodic maintenance: expire locks, expire idle presence, heartbeat.
class HeartbeatSweeper : public rt::IStoppable {
public:
  struct Options {
    std::chrono::seconds interval{30};
    std::chrono::hours   inactiveAfter{24};
  };

  HeartbeatSweeper(boost::asio::io_context& ioc,
                   LockManager* locks,
                   PresenceTracker* presence,
                   const RoomBroadcaster* broadcaster,
                   const util::Clock* clock,
                   Options opts);

  void start();
  void stop() noexcept override;

  // One sweep + heartbeat, independent of the timer.
  void tick();

  std::uint64_t ticks() const { return ticks_.load(); }

private:
  void arm();

  boost::asio::steady_timer timer_;
  LockManager*              locks_;
  PresenceTracker*          presence_;
  const RoomBroadcaster*    broadcaster_;
  const util::Clock*        clock_;
  Options                   opts_;

  std::atomic<bool>          running_{false};
  std::atomic<std::uint64_t> ticks_{0};
};

} // namespace collab::core
