#pragma once

#include "collab/Types.hpp"

namespace collab::store { class ActivityFeed; }
namespace collab::rt    { class ThreadPool; }

namespace collab::core {

// Fire-and-forget writer in front of the activity feed. Entries are written
// on the pool (inline without one); failures are logged and dropped.
class ActivityRecorder {
public:
  ActivityRecorder(store::ActivityFeed* feed, rt::ThreadPool* pool)
    : feed_(feed), pool_(pool) {}

  void record(ActivityEntry entry);

private:
  void write(const ActivityEntry& entry);

  store::ActivityFeed* feed_;
  rt::ThreadPool*      pool_;
};

} // namespace collab::core
