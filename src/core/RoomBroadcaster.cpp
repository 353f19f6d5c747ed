#include "collab/core/RoomBroadcaster.hpp"
#include "collab/core/ConnectionRegistry.hpp"
#include "collab/core/ConnectionSink.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"

#include <exception>

namespace collab::core {

namespace {

bool deliver(const ConnectionRegistry::Target& t, const std::string& frame) {
  if (!t.sink) return false;
  try {
    t.sink->sendText(frame);
    return true;
  } catch (const std::exception& ex) {
    util::logger().log(util::LogLevel::Warn, "broadcast.send_failed",
                       {{"connId", std::to_string(t.connId)}, {"error", ex.what()}});
    return false;
  }
}

} // namespace

std::size_t RoomBroadcaster::broadcast(const std::string& workspaceId, const std::string& frame,
                                       const std::optional<std::string>& excludeUserId) const {
  std::size_t n = 0;
  for (const auto& t : registry_->targetsIn(workspaceId, excludeUserId)) {
    if (deliver(t, frame)) ++n;
  }
  COLLAB_METRIC_INC("broadcast.frames", static_cast<double>(n));
  return n;
}

std::size_t RoomBroadcaster::broadcastAll(const std::string& frame) const {
  std::size_t n = 0;
  for (const auto& t : registry_->allTargets()) {
    if (deliver(t, frame)) ++n;
  }
  COLLAB_METRIC_INC("broadcast.frames", static_cast<double>(n));
  return n;
}

bool RoomBroadcaster::sendTo(ConnId connId, const std::string& frame) const {
  auto sink = registry_->sinkOf(connId);
  if (!sink) return false;
  return deliver(ConnectionRegistry::Target{connId, {}, std::move(sink)}, frame);
}

} // namespace collab::core
