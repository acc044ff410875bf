#include <iostream>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>
#include <vector>

// Utilities
#include "core/config_loader.hpp"
#include "core/detector.hpp"
#include "core/frame.hpp"
#include "core/traffic_analyzer.hpp"
#include "core/yolo_detector.hpp"

#include "infra/latest_store.hpp"
#include "infra/metrics.hpp"
#include "infra/stop_token.hpp"

// Stages
#include "stages/analytics_stage.hpp"
#include "stages/camera_stage.hpp"
#include "stages/reporting_stage.hpp"

#include "apps/ansi_dashboard.hpp"

static std::atomic_bool g_sigint{false};
static std::atomic_bool g_reset{false};
static std::atomic_bool g_reload{false};

static void HandleSigint(int) { g_sigint.store(true, std::memory_order_relaxed); }
static void HandleReset(int) { g_reset.store(true, std::memory_order_relaxed); }
static void HandleReload(int) { g_reload.store(true, std::memory_order_relaxed); }

static std::shared_ptr<fta::Detector> MakeDetector(const fta::DetectorConfig& cfg) {
  if (cfg.backend == "none") return nullptr;

  fta::YoloDetector::Params p;
  p.onnx_path = cfg.model_path;
  p.input_w = cfg.input_width;
  p.input_h = cfg.input_height;
  p.conf_thresh = cfg.confidence_threshold;
  p.nms_thresh = cfg.nms_threshold;
  p.intra_op_threads = cfg.threads;

  auto yolo = std::make_shared<fta::YoloDetector>(std::move(p));
  if (!yolo->is_loaded()) {
    std::cerr << "Detector not loaded, running without detections" << std::endl;
    return nullptr;
  }
  return yolo;
}

// live_pipeline.cpp runs the full system on a camera (or a video file given as camera.source)
//   SIGINT  -> shut down
//   SIGUSR1 -> reset all counters
//   SIGHUP  -> reload zones, counting line and thresholds from the config file

int main(int argc, char** argv) {
  const std::string cfg_path = (argc > 1) ? argv[1] : "configs/dev.yaml";

  try {
    fta::AppConfig cfg = fta::LoadConfigFromYamlFile(cfg_path);
    std::cout << "Loaded config OK: " << cfg_path << "\n";

    std::signal(SIGINT, HandleSigint);
    std::signal(SIGUSR1, HandleReset);
    std::signal(SIGHUP, HandleReload);

    fta::StopSource global_stop;
    fta::Metrics metrics;

    // Shared resources
    auto snapshots = std::make_shared<fta::LatestStore<fta::AnalyticsSnapshot>>();
    auto analyzer = std::make_shared<fta::TrafficAnalyzer>(fta::MakeAnalyzerSettings(cfg));
    auto detector = MakeDetector(cfg.detector);

    std::vector<std::shared_ptr<fta::SnapshotSink>> sinks;
    if (cfg.reporting.enable_console_dashboard) {
      sinks.push_back(std::make_shared<fta::AnsiDashboard>(metrics, g_sigint));
    }

    // Stages
    fta::AnalyticsStage analytics_stage(metrics.make_stage("analytics"), detector, analyzer, snapshots);
    fta::ReportingStage reporting_stage(cfg.reporting, snapshots, std::move(sinks));
    fta::CameraStage camera_stage(metrics.make_stage("camera"), cfg.camera,
                                  [&analytics_stage](fta::Frame f) { return analytics_stage.try_submit(std::move(f)); });

    // Consumers first
    reporting_stage.start(global_stop.token());
    analytics_stage.start(global_stop.token());
    camera_stage.start(global_stop.token());

    while (!global_stop.stop_requested()) {
      if (g_sigint.load(std::memory_order_relaxed)) {
        std::cout << "\nShutting down pipeline..." << std::endl;
        global_stop.request_stop();
        break;
      }

      if (camera_stage.finished()) {
        std::cout << "Source finished. Shutting down pipeline..." << std::endl;
        global_stop.request_stop();
        break;
      }

      if (g_reset.exchange(false, std::memory_order_relaxed)) {
        analytics_stage.request_reset();
      }

      if (g_reload.exchange(false, std::memory_order_relaxed)) {
        try {
          const fta::AppConfig fresh = fta::LoadConfigFromYamlFile(cfg_path);
          analytics_stage.request_settings(fta::MakeAnalyzerSettings(fresh));
          std::cout << "Reloaded config: " << cfg_path << std::endl;
        } catch (const std::exception& e) {
          std::cerr << "Config reload failed, keeping current settings: " << e.what() << std::endl;
        }
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    // Producers first
    camera_stage.stop();
    analytics_stage.stop();
    reporting_stage.stop();

    // Final report with whatever arrived after the last interval
    reporting_stage.publish_once();

  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  return 0;
}
