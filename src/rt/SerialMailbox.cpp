#include "collab/rt/SerialMailbox.hpp"
#include "collab/rt/ThreadPool.hpp"
#include "collab/util/Logger.hpp"

#include <exception>

namespace collab::rt {

void SerialMailbox::post(Job job) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (closed_) return;
    q_.push_back(std::move(job));
    if (running_) return;
    running_ = true;
  }

  if (pool_) {
    pool_->post([self = shared_from_this()]{ self->runQueued(); });
  } else {
    runQueued();
  }
}

void SerialMailbox::close() {
  std::lock_guard<std::mutex> lk(mx_);
  closed_ = true;
}

std::size_t SerialMailbox::pending() const {
  std::lock_guard<std::mutex> lk(mx_);
  return q_.size();
}

void SerialMailbox::runQueued() {
  for (;;) {
    Job job;
    {
      std::lock_guard<std::mutex> lk(mx_);
      if (q_.empty()) {
        running_ = false;
        return;
      }
      job = std::move(q_.front());
      q_.pop_front();
    }
    try {
      job();
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Error, "mailbox.job_failed", {{"error", ex.what()}});
    }
  }
}

} // namespace collab::rt
