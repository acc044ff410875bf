#include "check.hpp"
#include "infra/metrics.hpp"

static void LatencyAverage() {
  fta::StageMetrics m("analytics");
  m.on_item(800);
  FTA_CHECK(m.avg_latency_ns.load() == 800);

  // (800 * 7 + 1600) / 8
  m.on_item(1600);
  FTA_CHECK(m.avg_latency_ns.load() == 900);
  FTA_CHECK(m.last_latency_ns.load() == 1600);
  FTA_CHECK(m.work_ns_total.load() == 2400);
  FTA_CHECK(m.count.load() == 2);
}

static void DropRatio() {
  fta::StageMetrics m("camera");
  FTA_CHECK_NEAR(m.view().drop_ratio(), 0.0, 1e-12);

  m.on_item(10);
  m.on_drop();
  m.on_drop();
  m.on_failure();

  const fta::StageMetricsView v = m.view();
  FTA_CHECK(v.name == "camera");
  FTA_CHECK(v.count == 1);
  FTA_CHECK(v.dropped == 2);
  FTA_CHECK(v.failed == 1);
  FTA_CHECK_NEAR(v.drop_ratio(), 0.5, 1e-12);
}

static void IdleTime() {
  fta::StageMetrics m("reporting");
  const std::uint64_t last = m.last_event_ns.load();
  FTA_CHECK(m.view(last + 5000).idle_ns == 5000);
  // A clock reading older than the last event is not negative idle time
  FTA_CHECK(m.view(last - 1).idle_ns == 0);
}

static void RegistryKeepsOrder() {
  fta::Metrics metrics;
  metrics.make_stage("analytics")->on_item(1);
  metrics.make_stage("camera")->on_drop();

  const auto views = metrics.views();
  FTA_CHECK(views.size() == 2);
  if (views.size() == 2) {
    FTA_CHECK(views[0].name == "analytics" && views[0].count == 1);
    FTA_CHECK(views[1].name == "camera" && views[1].dropped == 1);
  }
}

int main() {
  LatencyAverage();
  DropRatio();
  IdleTime();
  RegistryKeepsOrder();
  return fta::test::Finish("metrics_test");
}
