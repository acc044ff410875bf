#include <stdexcept>
#include <string>

#include "check.hpp"
#include "core/config_loader.hpp"

// fn must throw, and the message must name the offending key path
template <typename Fn>
static void ExpectConfigError(Fn&& fn, const std::string& key_path) {
  try {
    fn();
  } catch (const std::runtime_error& e) {
    const std::string what = e.what();
    if (what.find("'" + key_path + "'") != std::string::npos) return;
    std::cerr << "wrong key path, wanted " << key_path << ", got: " << what << std::endl;
    ++fta::test::Failures();
    return;
  }
  std::cerr << "no config error for " << key_path << std::endl;
  ++fta::test::Failures();
}

static void EmptyDocumentUsesDefaults() {
  const fta::AppConfig cfg = fta::LoadConfigFromYamlString("{}");

  FTA_CHECK(cfg.camera.backend == "opencv");
  FTA_CHECK(cfg.camera.width == 1920);
  FTA_CHECK(cfg.detector.backend == "onnx");
  FTA_CHECK_NEAR(cfg.tracking.track_thresh, 0.5f, 1e-6);
  FTA_CHECK_NEAR(cfg.tracking.match_thresh, 0.8f, 1e-6);
  FTA_CHECK(cfg.tracking.track_buffer == 30);
  FTA_CHECK(cfg.crowd.crowd_mode_threshold == 20);
  FTA_CHECK_NEAR(cfg.crowd.high_density_threshold, 0.7f, 1e-6);
  FTA_CHECK(cfg.counting_line.start == cv::Point2f(0.f, 540.f));
  FTA_CHECK(cfg.counting_line.end == cv::Point2f(1920.f, 540.f));
  FTA_CHECK(cfg.zones.size() == 1);
  FTA_CHECK(!cfg.zones.empty() && cfg.zones[0].id == "default");
  FTA_CHECK(cfg.reporting.publish_interval_ms == 1000);
}

static void FullDocument() {
  const std::string yaml = R"(
detector:
  backend: none
tracking:
  track_thresh: 0.6
  match_thresh: 0.7
  track_buffer: 15
crowd:
  crowd_mode_threshold: 40
  high_density_threshold: 0.8
counting_line:
  start: [0, 300]
  end: [1280, 320]
zones:
  - id: door
    name: Front door
    capacity: 8
    type: entry
    points: [[0, 0], [200, 0], [200, 200], [0, 200]]
  - id: till
    points: [[300, 300], [500, 300], [400, 500]]
reporting:
  publish_interval_ms: 250
  log_events: true
)";
  const fta::AppConfig cfg = fta::LoadConfigFromYamlString(yaml);

  FTA_CHECK(cfg.detector.backend == "none");
  FTA_CHECK(cfg.tracking.track_buffer == 15);
  FTA_CHECK(cfg.counting_line.end == cv::Point2f(1280.f, 320.f));
  FTA_CHECK(cfg.zones.size() == 2);
  if (cfg.zones.size() == 2) {
    FTA_CHECK(cfg.zones[0].name == "Front door");
    FTA_CHECK(cfg.zones[0].type == fta::ZoneType::Entry);
    FTA_CHECK(cfg.zones[0].capacity == 8);
    FTA_CHECK(cfg.zones[0].points.size() == 4);
    // Name falls back to the id, type and capacity to their defaults
    FTA_CHECK(cfg.zones[1].name == "till");
    FTA_CHECK(cfg.zones[1].type == fta::ZoneType::Counting);
    FTA_CHECK(cfg.zones[1].capacity == 50);
    FTA_CHECK(cfg.zones[1].contains(400.f, 350.f));
  }

  const fta::AnalyzerSettings s = fta::MakeAnalyzerSettings(cfg);
  FTA_CHECK_NEAR(s.tracker.track_thresh, 0.6f, 1e-6);
  FTA_CHECK_NEAR(s.tracker.match_thresh, 0.7f, 1e-6);
  FTA_CHECK(s.tracker.track_buffer == 15);
  FTA_CHECK(s.crowd.crowd_mode_threshold == 40);
  FTA_CHECK_NEAR(s.crowd.high_density_threshold, 0.8f, 1e-6);
  FTA_CHECK(s.line.start == cv::Point2f(0.f, 300.f));
  FTA_CHECK(s.zones.size() == 2);
  FTA_CHECK(s.log_events);
}

static void EmptyZoneListIsAllowed() {
  const fta::AppConfig cfg = fta::LoadConfigFromYamlString("zones: []");
  FTA_CHECK(cfg.zones.empty());
}

static void InvalidValuesNameTheirKey() {
  ExpectConfigError([] { fta::LoadConfigFromYamlString("tracking: {match_thresh: 1.5}"); }, "tracking.match_thresh");
  ExpectConfigError([] { fta::LoadConfigFromYamlString("tracking: {match_thresh: 0}"); }, "tracking.match_thresh");
  ExpectConfigError([] { fta::LoadConfigFromYamlString("tracking: {track_buffer: nope}"); }, "tracking.track_buffer");
  ExpectConfigError([] { fta::LoadConfigFromYamlString("camera: {backend: gstreamer}"); }, "camera.backend");
  ExpectConfigError([] { fta::LoadConfigFromYamlString("detector: {backend: tensorrt}"); }, "detector.backend");
  ExpectConfigError([] { fta::LoadConfigFromYamlString("counting_line: {start: [1, 2, 3]}"); }, "counting_line.start");
  ExpectConfigError([] { fta::LoadConfigFromYamlString("counting_line: {start: [5, 5], end: [5, 5]}"); },
                    "counting_line");
  ExpectConfigError([] { fta::LoadConfigFromYamlString("reporting: {publish_interval_ms: 0}"); },
                    "reporting.publish_interval_ms");

  ExpectConfigError([] { fta::LoadConfigFromYamlString("zones: [{id: a, points: [[0, 0], [1, 1]]}]"); },
                    "zones[0].points");
  ExpectConfigError([] { fta::LoadConfigFromYamlString("zones: [{id: a, type: lobby, points: [[0, 0], [1, 0], [1, 1]]}]"); },
                    "zones[0].type");
  ExpectConfigError([] { fta::LoadConfigFromYamlString("zones: [{id: a, points: [[0, 0], [1, 0], [1, x]]}]"); },
                    "zones[0].points[2]");
  ExpectConfigError(
      [] {
        fta::LoadConfigFromYamlString(
            "zones: [{id: a, points: [[0, 0], [1, 0], [1, 1]]}, {id: a, points: [[0, 0], [1, 0], [1, 1]]}]");
      },
      "zones[1].id");
  ExpectConfigError([] { fta::LoadConfigFromYamlString("zones: {id: a}"); }, "zones");
}

static void FilesLoadOrFail() {
  FTA_CHECK_THROWS(fta::LoadConfigFromYamlFile("configs/does_not_exist.yaml"), std::runtime_error);

  // Tests run from the source tree
  const fta::AppConfig dev = fta::LoadConfigFromYamlFile("configs/dev.yaml");
  FTA_CHECK(dev.zones.size() == 1);
  FTA_CHECK(dev.detector.threads == 2);
}

int main() {
  EmptyDocumentUsesDefaults();
  FullDocument();
  EmptyZoneListIsAllowed();
  InvalidValuesNameTheirKey();
  FilesLoadOrFail();
  return fta::test::Finish("config_loader_test");
}
