#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <opencv2/core.hpp>

#include "check.hpp"
#include "core/detector.hpp"
#include "core/snapshot_sink.hpp"
#include "core/traffic_analyzer.hpp"
#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"
#include "stages/analytics_stage.hpp"
#include "stages/reporting_stage.hpp"

using Store = fta::LatestStore<fta::AnalyticsSnapshot>;

static fta::Frame MakeFrame(std::uint64_t seq) {
  fta::Frame f;
  f.sequence_id = seq;
  f.capture_time = std::chrono::steady_clock::now();
  f.image = cv::Mat(480, 640, CV_8UC3, cv::Scalar(128, 128, 128));
  return f;
}

static fta::Detection PersonAt(float cx, float cy) {
  fta::Detection d;
  d.bbox = fta::BBox::FromCenter(cx, cy, 40.f, 80.f);
  d.confidence = 0.9f;
  return d;
}

// Holds every detect() call until open() is called
class GateDetector final : public fta::Detector {
public:
  fta::DetectionList detect(const fta::Frame&) override {
    entered_.fetch_add(1);
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [&] { return open_; });
    return {PersonAt(320.f, 200.f)};
  }

  void open() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      open_ = true;
    }
    cv_.notify_all();
  }

  int entered() const { return entered_.load(); }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool open_{false};
  std::atomic<int> entered_{0};
};

// One person walking down across y = 540, throws on the frames it is told to
class ScriptedDetector final : public fta::Detector {
public:
  explicit ScriptedDetector(std::uint64_t fail_on = 0) : fail_on_(fail_on) {}

  fta::DetectionList detect(const fta::Frame& frame) override {
    if (frame.sequence_id == fail_on_) throw std::runtime_error("detector failure");
    const float y = 490.f + 20.f * static_cast<float>((frame.sequence_id - 1) % 6);
    return {PersonAt(320.f, y)};
  }

private:
  std::uint64_t fail_on_;
};

class RecordingSink final : public fta::SnapshotSink {
public:
  void publish(const fta::AnalyticsSnapshot& s) override {
    std::lock_guard<std::mutex> lock(mu_);
    seen_.push_back(s.frame_id);
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return seen_.size();
  }

  std::uint64_t last() const {
    std::lock_guard<std::mutex> lock(mu_);
    return seen_.empty() ? 0 : seen_.back();
  }

private:
  mutable std::mutex mu_;
  std::vector<std::uint64_t> seen_;
};

class BrokenSink final : public fta::SnapshotSink {
public:
  void publish(const fta::AnalyticsSnapshot&) override { throw std::runtime_error("sink offline"); }
};

static bool Idle(const fta::AnalyticsStage& stage, std::uint64_t processed, std::uint64_t failed = 0) {
  return stage.processed_total() == processed && stage.failed_total() == failed && !stage.busy();
}

static void DropsWhileBusy() {
  fta::StopSource stop;
  fta::Metrics metrics;
  auto* m = metrics.make_stage("analytics");
  auto gate = std::make_shared<GateDetector>();
  auto analyzer = std::make_shared<fta::TrafficAnalyzer>();
  auto store = std::make_shared<Store>();

  fta::AnalyticsStage stage(m, gate, analyzer, store);
  stage.start(stop.token());

  FTA_CHECK(stage.try_submit(MakeFrame(1)));
  FTA_CHECK(!stage.try_submit(MakeFrame(2)));
  FTA_CHECK(fta::test::WaitFor([&] { return gate->entered() == 1; }));
  FTA_CHECK(stage.busy());
  FTA_CHECK(!stage.try_submit(MakeFrame(3)));
  FTA_CHECK(stage.dropped_total() == 2);
  FTA_CHECK(m->dropped.load() == 2);

  gate->open();
  FTA_CHECK(fta::test::WaitFor([&] { return Idle(stage, 1); }));

  const auto snap = store->read_latest();
  FTA_CHECK(snap.has_value());
  if (snap) {
    FTA_CHECK(snap->frame_id == 1);
    FTA_CHECK(snap->current_count == 1);
  }

  FTA_CHECK(stage.try_submit(MakeFrame(4)));
  FTA_CHECK(fta::test::WaitFor([&] { return Idle(stage, 2); }));
  FTA_CHECK(gate->entered() == 2);
  FTA_CHECK(m->count.load() == 2);

  stage.stop();
}

static void FailedFrameIsSkipped() {
  fta::StopSource stop;
  auto analyzer = std::make_shared<fta::TrafficAnalyzer>();
  auto store = std::make_shared<Store>();
  fta::Metrics metrics;
  auto* m = metrics.make_stage("analytics");

  fta::AnalyticsStage stage(m, std::make_shared<ScriptedDetector>(2), analyzer, store);
  stage.start(stop.token());

  FTA_CHECK(stage.try_submit(MakeFrame(1)));
  FTA_CHECK(fta::test::WaitFor([&] { return Idle(stage, 1); }));

  FTA_CHECK(stage.try_submit(MakeFrame(2)));
  FTA_CHECK(fta::test::WaitFor([&] { return Idle(stage, 1, 1); }));
  FTA_CHECK(m->failed.load() == 1);
  FTA_CHECK(store->read_latest()->frame_id == 1);

  FTA_CHECK(stage.try_submit(MakeFrame(3)));
  FTA_CHECK(fta::test::WaitFor([&] { return Idle(stage, 2, 1); }));
  FTA_CHECK(store->read_latest()->frame_id == 3);
  FTA_CHECK(analyzer->counters().current_count == 1);

  stage.stop();
}

static void ResetAndSettingsBetweenFrames() {
  fta::StopSource stop;
  auto analyzer = std::make_shared<fta::TrafficAnalyzer>();
  auto store = std::make_shared<Store>();

  fta::AnalyticsStage stage(nullptr, std::make_shared<ScriptedDetector>(), analyzer, store);
  stage.start(stop.token());

  for (std::uint64_t seq = 1; seq <= 6; ++seq) {
    FTA_CHECK(stage.try_submit(MakeFrame(seq)));
    FTA_CHECK(fta::test::WaitFor([&] { return Idle(stage, seq); }));
  }
  FTA_CHECK(analyzer->counters().total_exits == 1);
  FTA_CHECK(store->read_latest()->total_exits == 1);

  stage.request_reset();
  FTA_CHECK(fta::test::WaitFor([&] { return !store->has_value(); }));
  FTA_CHECK(analyzer->counters().total_exits == 0);

  fta::AnalyzerSettings settings;
  fta::Zone lobby;
  lobby.id = "lobby";
  lobby.name = "Lobby";
  lobby.points = {{0.f, 0.f}, {640.f, 0.f}, {640.f, 1080.f}, {0.f, 1080.f}};
  lobby.capacity = 4;
  settings.zones = {lobby};
  stage.request_settings(settings);

  FTA_CHECK(stage.try_submit(MakeFrame(7)));
  FTA_CHECK(fta::test::WaitFor([&] { return Idle(stage, 7); }));

  const auto snap = store->read_latest();
  FTA_CHECK(snap.has_value());
  if (snap) {
    FTA_CHECK(snap->zones.size() == 1);
    if (snap->zones.size() == 1) {
      FTA_CHECK(snap->zones[0].id == "lobby");
      FTA_CHECK(snap->zones[0].count == 1);
      FTA_CHECK_NEAR(snap->zones[0].occupancy_percent, 25.f, 1e-4);
    }
    FTA_CHECK(snap->total_exits == 0);
  }

  stage.stop();
}

static void NoDetectorMeansNoPeople() {
  fta::StopSource stop;
  auto analyzer = std::make_shared<fta::TrafficAnalyzer>();
  auto store = std::make_shared<Store>();

  fta::AnalyticsStage stage(nullptr, nullptr, analyzer, store);
  stage.start(stop.token());

  FTA_CHECK(stage.try_submit(MakeFrame(1)));
  FTA_CHECK(fta::test::WaitFor([&] { return Idle(stage, 1); }));
  FTA_CHECK(store->read_latest()->current_count == 0);

  // The global stop ends the worker as well
  stop.request_stop();
  stage.stop();
  FTA_CHECK(!stage.busy());
}

static void ReportingPublishesNewSnapshotsOnly() {
  auto store = std::make_shared<Store>();
  auto sink = std::make_shared<RecordingSink>();
  fta::ReportingConfig cfg;
  cfg.publish_interval_ms = 20;

  fta::ReportingStage reporting(cfg, store, {std::make_shared<BrokenSink>(), sink});

  FTA_CHECK(!reporting.publish_once());

  fta::AnalyticsSnapshot s;
  s.frame_id = 11;
  store->write(s);
  FTA_CHECK(reporting.publish_once());
  FTA_CHECK(!reporting.publish_once());
  FTA_CHECK(sink->size() == 1);
  FTA_CHECK(sink->last() == 11);

  // A cleared store has nothing to publish
  store->clear();
  FTA_CHECK(!reporting.publish_once());
  FTA_CHECK(reporting.published_total() == 1);

  fta::StopSource stop;
  reporting.start(stop.token());
  s.frame_id = 12;
  store->write(s);
  FTA_CHECK(fta::test::WaitFor([&] { return sink->size() == 2; }));
  FTA_CHECK(sink->last() == 12);
  reporting.stop();

  FTA_CHECK(reporting.published_total() == 2);
}

int main() {
  DropsWhileBusy();
  FailedFrameIsSkipped();
  ResetAndSettingsBetweenFrames();
  NoDetectorMeansNoPeople();
  ReportingPublishesNewSnapshotsOnly();
  return fta::test::Finish("pipeline_stages_test");
}
