#pragma once

#include "core/analytics_snapshot.hpp"

namespace fta {

// Receiver of periodic snapshots (storage, dashboards, exporters). Called from the reporting thread
class SnapshotSink {
public:
  virtual ~SnapshotSink() = default;

  virtual void publish(const AnalyticsSnapshot& snapshot) = 0;
};

} // namespace fta
