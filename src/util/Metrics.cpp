#include "collab/util/Metrics.hpp"
#include "collab/util/Logger.hpp"

#include <chrono>
#include <sstream>
#include <vector>

namespace collab {
namespace util {

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned int intervalSeconds) {
  // If already running, restart with new interval.
  stopReporter();

  running_.store(true, std::memory_order_release);
  thr_ = std::thread([this, intervalSeconds]{
    reporterLoop(intervalSeconds);
  });
}

void MetricRegistry::stopReporter() {
  {
    std::lock_guard<std::mutex> lk(wakeMu_);
    running_.store(false, std::memory_order_release);
  }
  wake_.notify_all();
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

void MetricRegistry::reporterLoop(unsigned int intervalSeconds) {
  using namespace std::chrono;
  const auto sleep_dur = seconds(intervalSeconds > 0 ? intervalSeconds : 10);

  for (;;) {
    {
      std::unique_lock<std::mutex> lk(wakeMu_);
      wake_.wait_for(lk, sleep_dur, [this]{ return !running_.load(std::memory_order_acquire); });
      if (!running_.load(std::memory_order_acquire)) return;
    }

    std::unordered_map<std::string, double> c;
    std::unordered_map<std::string, double> g;
    {
      std::lock_guard<std::mutex> lk(mu_);
      c = counters_;
      g = gauges_;
    }
    if (c.empty() && g.empty()) continue;

    std::vector<Field> fields;
    fields.reserve(c.size() + g.size());
    for (auto& kv : c) {
      std::ostringstream v; v << kv.second;
      fields.push_back({kv.first, v.str()});
    }
    for (auto& kv : g) {
      std::ostringstream v; v << kv.second;
      fields.push_back({kv.first, v.str()});
    }
    logger().log(LogLevel::Info, "metrics", fields);
  }
}

} // namespace util
} // namespace collab
