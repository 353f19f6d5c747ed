#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>

namespace collab::rt {

class ThreadPool;

// Runs posted jobs one at a time, in FIFO order, on a shared pool.
// Several mailboxes make progress in parallel; a single mailbox never does.
// Without a pool, jobs run inline on the posting thread.
class SerialMailbox : public std::enable_shared_from_this<SerialMailbox> {
public:
  using Job = std::function<void()>;

  static std::shared_ptr<SerialMailbox> create(ThreadPool* pool) {
    return std::shared_ptr<SerialMailbox>(new SerialMailbox(pool));
  }

  void post(Job job);

  // Jobs posted after close() are dropped; queued ones still run.
  void close();

  std::size_t pending() const;

private:
  explicit SerialMailbox(ThreadPool* pool) : pool_(pool) {}

  void runQueued();

  ThreadPool* pool_{nullptr};
  mutable std::mutex mx_;
  std::deque<Job> q_;
  bool running_{false};
  bool closed_{false};
};

} // namespace collab::rt
