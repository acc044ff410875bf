#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

/*
  Per-stage counters shared between a stage thread (writer) and the console dashboard (reader).

  A stage records one on_item() per frame it finished, one on_drop() per frame it had to turn away (backpressure)
  and one on_failure() per frame that threw. view() turns the atomics into plain numbers for display; the values are
  read one at a time, so a view may mix two consecutive updates.
*/

namespace fta {

using SteadyClock = std::chrono::steady_clock;

inline std::uint64_t NowNs() {
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(
          SteadyClock::now().time_since_epoch())
          .count());
}

struct StageMetricsView {
  std::string name;
  std::uint64_t count{0};
  std::uint64_t dropped{0};
  std::uint64_t failed{0};
  std::uint64_t avg_latency_ns{0};
  std::uint64_t last_latency_ns{0};
  std::uint64_t idle_ns{0};  // Since the last finished item

  // dropped / (count + dropped + failed), 0 before the first frame
  double drop_ratio() const {
    const std::uint64_t offered = count + dropped + failed;
    return (offered == 0) ? 0.0 : static_cast<double>(dropped) / static_cast<double>(offered);
  }
};

struct StageMetrics {
  std::string name;

  std::atomic<std::uint64_t> count{0};
  std::atomic<std::uint64_t> dropped{0};
  std::atomic<std::uint64_t> failed{0};
  std::atomic<std::uint64_t> avg_latency_ns{0};
  std::atomic<std::uint64_t> last_latency_ns{0};
  std::atomic<std::uint64_t> last_event_ns{0};

  std::atomic<std::uint64_t> work_ns_total{0};

  explicit StageMetrics(std::string n) : name(std::move(n)) {
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_item(std::uint64_t latency_ns) {
    count.fetch_add(1, std::memory_order_relaxed);

    // EMA with 1/8 weight on the newest sample
    auto prev = avg_latency_ns.load(std::memory_order_relaxed);
    auto next = (prev == 0) ? latency_ns : (prev * 7 + latency_ns) / 8;
    avg_latency_ns.store(next, std::memory_order_relaxed);
    last_latency_ns.store(latency_ns, std::memory_order_relaxed);

    work_ns_total.fetch_add(latency_ns, std::memory_order_relaxed);
    last_event_ns.store(NowNs(), std::memory_order_relaxed);
  }

  void on_drop() { dropped.fetch_add(1, std::memory_order_relaxed); }

  void on_failure() { failed.fetch_add(1, std::memory_order_relaxed); }

  StageMetricsView view(std::uint64_t now_ns = NowNs()) const {
    StageMetricsView v;
    v.name = name;
    v.count = count.load(std::memory_order_relaxed);
    v.dropped = dropped.load(std::memory_order_relaxed);
    v.failed = failed.load(std::memory_order_relaxed);
    v.avg_latency_ns = avg_latency_ns.load(std::memory_order_relaxed);
    v.last_latency_ns = last_latency_ns.load(std::memory_order_relaxed);
    const std::uint64_t last = last_event_ns.load(std::memory_order_relaxed);
    v.idle_ns = (now_ns > last) ? now_ns - last : 0;
    return v;
  }
};

// Owned by the pipeline, one StageMetrics per stage. Stages must be created before any thread starts reading
class Metrics {
public:
  StageMetrics* make_stage(std::string name) {
    stages_.push_back(std::make_unique<StageMetrics>(std::move(name)));
    return stages_.back().get();
  }

  const std::vector<std::unique_ptr<StageMetrics>>& stages() const { return stages_; }

  std::vector<StageMetricsView> views() const {
    const std::uint64_t now = NowNs();
    std::vector<StageMetricsView> out;
    out.reserve(stages_.size());
    for (const auto& s : stages_) out.push_back(s->view(now));
    return out;
  }

private:
  std::vector<std::unique_ptr<StageMetrics>> stages_;
};

} // namespace fta
