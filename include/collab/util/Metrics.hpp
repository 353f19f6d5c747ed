#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <condition_variable>
#include <unordered_map>

namespace collab {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
// Optional: can run a background reporter thread that logs both.
class MetricRegistry {
public:
  static MetricRegistry& instance() {
    static MetricRegistry inst;
    return inst;
  }

  MetricRegistry() = default;
  ~MetricRegistry();

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  void startReporter(unsigned int intervalSeconds = 10);
  void stopReporter();

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  double counter(const std::string& name) const;

private:
  void reporterLoop(unsigned int intervalSeconds);

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;

  std::atomic<bool> running_{false};
  std::mutex wakeMu_;
  std::condition_variable wake_;
  std::thread thr_;
};

} // namespace util

#define COLLAB_METRIC_INC(name, d) ::collab::util::MetricRegistry::instance().increment((name), (d))
#define COLLAB_METRIC_HIT(name)    ::collab::util::MetricRegistry::instance().increment((name), 1.0)
#define COLLAB_METRIC_SET(name, v) ::collab::util::MetricRegistry::instance().setGauge((name), (v))

} // namespace collab
