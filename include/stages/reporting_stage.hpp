#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/analytics_snapshot.hpp"
#include "core/config.hpp"
#include "core/snapshot_sink.hpp"
#include "infra/latest_store.hpp"
#include "stages/stage.hpp"

namespace fta {

// Pushes the newest snapshot to every sink once per publish interval. Intervals with no new snapshot publish nothing
class ReportingStage final : public Stage {
public:
  ReportingStage(ReportingConfig cfg,
                 std::shared_ptr<LatestStore<AnalyticsSnapshot>> snapshots,
                 std::vector<std::shared_ptr<SnapshotSink>> sinks);

  std::uint64_t published_total() const { return published_.load(std::memory_order_relaxed); }

  // One publish round, also used by run(). Returns true if a new snapshot was published
  bool publish_once();

protected:
  void run(const StopToken& global_stop,
           const std::atomic_bool& local_stop) override;

private:
  ReportingConfig cfg_;
  std::shared_ptr<LatestStore<AnalyticsSnapshot>> snapshots_;
  std::vector<std::shared_ptr<SnapshotSink>> sinks_;

  std::uint64_t last_version_{0};
  std::atomic<std::uint64_t> published_{0};
};

} // namespace fta
