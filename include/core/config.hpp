#pragma once
#include <string>
#include <vector>

#include "core/line_counter.hpp"
#include "core/zone.hpp"

namespace fta {

struct CameraConfig {
  std::string backend = "opencv"; // opencv (cv::VideoCapture)
  std::string source = "";  // Video file or stream URL. Empty uses device_index
  int device_index = 0;

  int width = 1920;
  int height = 1080;
  int fps = 30;

  bool flip_vertical = false;
  bool flip_horizontal = false;
};

struct DetectorConfig {
  std::string backend = "onnx"; // onnx | none
  std::string model_path = "models/yolov8n.onnx";
  int input_width = 640;
  int input_height = 640;
  float confidence_threshold = 0.45f;
  float nms_threshold = 0.5f;
  int threads = 1;
};

struct TrackingConfig {
  float track_thresh = 0.5f;
  float match_thresh = 0.8f;
  int track_buffer = 30;
};

struct CrowdConfig {
  int crowd_mode_threshold = 20;
  float high_density_threshold = 0.7f;
};

struct ReportingConfig {
  int publish_interval_ms = 1000;
  bool enable_console_dashboard = true;
  bool log_events = false;
};

struct AppConfig {
  CameraConfig camera{};
  DetectorConfig detector{};
  TrackingConfig tracking{};
  CrowdConfig crowd{};
  CountingLine counting_line{};
  std::vector<Zone> zones{DefaultZone()};
  ReportingConfig reporting{};
};

}
