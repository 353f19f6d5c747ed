#include "collab/core/HeartbeatSweeper.hpp"
#include "collab/core/LockManager.hpp"
#include "collab/core/PresenceTracker.hpp"
#include "collab/core/RoomBroadcaster.hpp"
#include "collab/protocol/Codec.hpp"
#include "collab/util/Clock.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"

#include <exception>

namespace collab::core {

HeartbeatSweeper::HeartbeatSweeper(boost::asio::io_context& ioc,
                                   LockManager* locks,
                                   PresenceTracker* presence,
                                   const RoomBroadcaster* broadcaster,
                                   const util::Clock* clock,
                                   Options opts)
  : timer_(ioc)
  , locks_(locks)
  , presence_(presence)
  , broadcaster_(broadcaster)
  , clock_(clock ? clock : &util::systemClock())
  , opts_(opts)
{
  if (opts_.interval.count() <= 0) opts_.interval = std::chrono::seconds(1);
}

void HeartbeatSweeper::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) return;
  util::logger().log(util::LogLevel::Info, "sweeper.start",
                     {{"intervalSeconds", std::to_string(opts_.interval.count())}});
  arm();
}

void HeartbeatSweeper::stop() noexcept {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) return;
  try {
    timer_.cancel();
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Warn, "sweeper.cancel_failed", {{"error", ex.what()}});
  }
}

void HeartbeatSweeper::arm() {
  timer_.expires_after(opts_.interval);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec || !running_.load()) return;
    tick();
    arm();
  });
}

void HeartbeatSweeper::tick() {
  const Timestamp now = clock_->now();

  try {
    if (locks_) locks_->sweepExpired(now);
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "sweeper.locks_failed", {{"error", ex.what()}});
  }

  try {
    if (presence_) presence_->expireInactive(now - opts_.inactiveAfter);
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Error, "sweeper.presence_failed", {{"error", ex.what()}});
  }

  std::size_t delivered = 0;
  if (broadcaster_) delivered = broadcaster_->broadcastAll(protocol::encodeHeartbeat(now));

  ++ticks_;
  COLLAB_METRIC_HIT("sweeper.ticks");
  util::logger().log(util::LogLevel::Debug, "sweeper.tick",
                     {{"connections", std::to_string(delivered)}});
}

} // namespace collab::core
