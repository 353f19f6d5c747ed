#include "collab/core/ActivityRecorder.hpp"
#include "collab/rt/ThreadPool.hpp"
#include "collab/store/Stores.hpp"
#include "collab/util/Logger.hpp"
#include "collab/util/Metrics.hpp"

#include <exception>

namespace collab::core {

void ActivityRecorder::record(ActivityEntry entry) {
  if (!feed_) return;
  if (pool_) {
    pool_->post([this, e = std::move(entry)]{ write(e); });
  } else {
    write(entry);
  }
}

void ActivityRecorder::write(const ActivityEntry& entry) {
  try {
    feed_->record(entry);
    COLLAB_METRIC_HIT("activity.recorded");
  } catch (const std::exception& ex) {
    COLLAB_METRIC_HIT("activity.dropped");
    util::logger().log(util::LogLevel::Warn, "activity.record_failed",
                       {{"workspaceId", entry.workspaceId},
                        {"type", entry.activityType},
                        {"error", ex.what()}});
  }
}

} // namespace collab::core
