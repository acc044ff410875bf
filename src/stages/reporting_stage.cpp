#include "stages/reporting_stage.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace fta {

ReportingStage::ReportingStage(ReportingConfig cfg,
                               std::shared_ptr<LatestStore<AnalyticsSnapshot>> snapshots,
                               std::vector<std::shared_ptr<SnapshotSink>> sinks)
    : Stage("reporting_stage"), cfg_(std::move(cfg)), snapshots_(std::move(snapshots)), sinks_(std::move(sinks)) {}

bool ReportingStage::publish_once() {
  const auto snap = snapshots_->read_if_newer(&last_version_);
  if (!snap) return false;

  for (const auto& sink : sinks_) {
    try {
      sink->publish(*snap);
    } catch (const std::exception& e) {
      std::cerr << "reporting_stage: sink failed: " << e.what() << std::endl;
    }
  }
  published_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

void ReportingStage::run(const StopToken& global, const std::atomic_bool& local) {
  const auto interval = std::chrono::milliseconds(cfg_.publish_interval_ms);

  while (SleepUnlessStopped(global, local, interval)) {
    publish_once();
  }
}

} // namespace fta
