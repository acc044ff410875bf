#pragma once

#include <atomic>
#include <string>

#include "core/snapshot_sink.hpp"
#include "infra/metrics.hpp"

namespace fta {

// Console sink: redraws an ANSI screen with the counters, per-zone occupancy and per-stage metrics
class AnsiDashboard final : public SnapshotSink {
public:
  AnsiDashboard(const Metrics& metrics, const std::atomic_bool& sigint_flag);

  void publish(const AnalyticsSnapshot& snapshot) override;

private:
  const Metrics& metrics_;
  const std::atomic_bool& sigint_;
  bool cleared_{false};
};

} // namespace fta
