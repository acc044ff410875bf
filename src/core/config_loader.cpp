#include "core/config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fta {

static std::string PathJoin(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (!a.empty() && a.back() == '.') return a + b;
  return a + "." + b;
}

static std::string IndexPath(const std::string& a, std::size_t i) {
  return a + "[" + std::to_string(i) + "]";
}

static std::runtime_error ConfigError(const std::string& key_path, const std::string& msg) {
  std::ostringstream oss;
  oss << "Config error at '" << key_path << "': " << msg;
  return std::runtime_error(oss.str());
}

static YAML::Node Child(const YAML::Node& parent, const char* key) {
  if (!parent || !parent.IsMap()) return YAML::Node();
  return parent[key];
}

template <typename T>
static T GetOrKey(const YAML::Node& parent, const char* key, const std::string& key_path, const T& fallback) {
  const YAML::Node n = Child(parent, key);
  if (!n) return fallback;
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

// [x, y]
static cv::Point2f ParsePoint(const YAML::Node& n, const std::string& key_path) {
  if (!n || !n.IsSequence() || n.size() != 2) throw ConfigError(key_path, "expected a point [x, y]");
  try {
    return cv::Point2f(n[0].as<float>(), n[1].as<float>());
  } catch (const YAML::Exception& e) {
    throw ConfigError(key_path, e.what());
  }
}

static void LoadCamera(const YAML::Node& root, CameraConfig& cfg) {
  const YAML::Node cam = root["camera"];
  if (!cam) return;
  const std::string p = "camera";

  cfg.backend = GetOrKey<std::string>(cam, "backend", PathJoin(p, "backend"), cfg.backend);
  cfg.source = GetOrKey<std::string>(cam, "source", PathJoin(p, "source"), cfg.source);
  cfg.device_index = GetOrKey<int>(cam, "device_index", PathJoin(p, "device_index"), cfg.device_index);
  cfg.width = GetOrKey<int>(cam, "width", PathJoin(p, "width"), cfg.width);
  cfg.height = GetOrKey<int>(cam, "height", PathJoin(p, "height"), cfg.height);
  cfg.fps = GetOrKey<int>(cam, "fps", PathJoin(p, "fps"), cfg.fps);
  cfg.flip_vertical = GetOrKey<bool>(cam, "flip_vertical", PathJoin(p, "flip_vertical"), cfg.flip_vertical);
  cfg.flip_horizontal = GetOrKey<bool>(cam, "flip_horizontal", PathJoin(p, "flip_horizontal"), cfg.flip_horizontal);
}

static void LoadDetector(const YAML::Node& root, DetectorConfig& cfg) {
  const YAML::Node det = root["detector"];
  if (!det) return;
  const std::string p = "detector";

  cfg.backend = GetOrKey<std::string>(det, "backend", PathJoin(p, "backend"), cfg.backend);
  cfg.model_path = GetOrKey<std::string>(det, "model_path", PathJoin(p, "model_path"), cfg.model_path);
  cfg.input_width = GetOrKey<int>(det, "input_width", PathJoin(p, "input_width"), cfg.input_width);
  cfg.input_height = GetOrKey<int>(det, "input_height", PathJoin(p, "input_height"), cfg.input_height);
  cfg.confidence_threshold = GetOrKey<float>(det, "confidence_threshold", PathJoin(p, "confidence_threshold"), cfg.confidence_threshold);
  cfg.nms_threshold = GetOrKey<float>(det, "nms_threshold", PathJoin(p, "nms_threshold"), cfg.nms_threshold);
  cfg.threads = GetOrKey<int>(det, "threads", PathJoin(p, "threads"), cfg.threads);
}

static void LoadTracking(const YAML::Node& root, TrackingConfig& cfg) {
  const YAML::Node tr = root["tracking"];
  if (!tr) return;
  const std::string p = "tracking";

  cfg.track_thresh = GetOrKey<float>(tr, "track_thresh", PathJoin(p, "track_thresh"), cfg.track_thresh);
  cfg.match_thresh = GetOrKey<float>(tr, "match_thresh", PathJoin(p, "match_thresh"), cfg.match_thresh);
  cfg.track_buffer = GetOrKey<int>(tr, "track_buffer", PathJoin(p, "track_buffer"), cfg.track_buffer);
}

static void LoadCrowd(const YAML::Node& root, CrowdConfig& cfg) {
  const YAML::Node cr = root["crowd"];
  if (!cr) return;
  const std::string p = "crowd";

  cfg.crowd_mode_threshold = GetOrKey<int>(cr, "crowd_mode_threshold", PathJoin(p, "crowd_mode_threshold"), cfg.crowd_mode_threshold);
  cfg.high_density_threshold = GetOrKey<float>(cr, "high_density_threshold", PathJoin(p, "high_density_threshold"), cfg.high_density_threshold);
}

static void LoadCountingLine(const YAML::Node& root, CountingLine& line) {
  const YAML::Node ln = root["counting_line"];
  if (!ln) return;
  const std::string p = "counting_line";

  if (ln["start"]) line.start = ParsePoint(ln["start"], PathJoin(p, "start"));
  if (ln["end"]) line.end = ParsePoint(ln["end"], PathJoin(p, "end"));
}

static Zone LoadZone(const YAML::Node& zn, const std::string& key_path) {
  if (!zn.IsMap()) throw ConfigError(key_path, "expected a map");

  Zone z;
  z.id = GetOrKey<std::string>(zn, "id", PathJoin(key_path, "id"), "");
  z.name = GetOrKey<std::string>(zn, "name", PathJoin(key_path, "name"), z.id);
  z.capacity = GetOrKey<int>(zn, "capacity", PathJoin(key_path, "capacity"), z.capacity);

  const std::string type = GetOrKey<std::string>(zn, "type", PathJoin(key_path, "type"), ToString(z.type));
  try {
    z.type = ParseZoneType(type);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(PathJoin(key_path, "type"), e.what());
  }

  const YAML::Node pts = zn["points"];
  const std::string pp = PathJoin(key_path, "points");
  if (!pts || !pts.IsSequence()) throw ConfigError(pp, "expected a list of [x, y] points");
  for (std::size_t i = 0; i < pts.size(); ++i) {
    z.points.push_back(ParsePoint(pts[i], IndexPath(pp, i)));
  }
  return z;
}

static void LoadZones(const YAML::Node& root, std::vector<Zone>& zones) {
  const YAML::Node zs = root["zones"];
  if (!zs) return;
  const std::string p = "zones";
  if (!zs.IsSequence()) throw ConfigError(p, "expected a list of zones");

  zones.clear();
  for (std::size_t i = 0; i < zs.size(); ++i) {
    zones.push_back(LoadZone(zs[i], IndexPath(p, i)));
  }
}

static void LoadReporting(const YAML::Node& root, ReportingConfig& cfg) {
  const YAML::Node rep = root["reporting"];
  if (!rep) return;
  const std::string p = "reporting";

  cfg.publish_interval_ms = GetOrKey<int>(rep, "publish_interval_ms", PathJoin(p, "publish_interval_ms"), cfg.publish_interval_ms);
  cfg.enable_console_dashboard = GetOrKey<bool>(rep, "enable_console_dashboard", PathJoin(p, "enable_console_dashboard"), cfg.enable_console_dashboard);
  cfg.log_events = GetOrKey<bool>(rep, "log_events", PathJoin(p, "log_events"), cfg.log_events);
}

static bool IsUnitInterval(float v) {
  return std::isfinite(v) && v >= 0.f && v <= 1.f;
}

void ValidateOrThrow(const AppConfig& cfg) {
  if (cfg.camera.backend != "opencv")
    throw ConfigError("camera.backend", "unknown backend '" + cfg.camera.backend + "'. Use: opencv");
  if (cfg.camera.width <= 0 || cfg.camera.height <= 0) throw ConfigError("camera", "width/height must be > 0");
  if (cfg.camera.fps <= 0) throw ConfigError("camera.fps", "must be > 0");

  if (cfg.detector.backend != "onnx" && cfg.detector.backend != "none")
    throw ConfigError("detector.backend", "unknown backend '" + cfg.detector.backend + "'. Use: onnx | none");
  if (cfg.detector.backend == "onnx" && cfg.detector.model_path.empty())
    throw ConfigError("detector.model_path", "required when detector.backend == 'onnx'");
  if (cfg.detector.input_width <= 0 || cfg.detector.input_height <= 0)
    throw ConfigError("detector", "input_width/input_height must be > 0");
  if (!IsUnitInterval(cfg.detector.confidence_threshold))
    throw ConfigError("detector.confidence_threshold", "must be in [0, 1]");
  if (!IsUnitInterval(cfg.detector.nms_threshold))
    throw ConfigError("detector.nms_threshold", "must be in [0, 1]");
  if (cfg.detector.threads < 1) throw ConfigError("detector.threads", "must be >= 1");

  if (!IsUnitInterval(cfg.tracking.track_thresh))
    throw ConfigError("tracking.track_thresh", "must be in [0, 1]");
  if (!IsUnitInterval(cfg.tracking.match_thresh) || cfg.tracking.match_thresh == 0.f)
    throw ConfigError("tracking.match_thresh", "must be in (0, 1]");
  if (cfg.tracking.track_buffer < 0) throw ConfigError("tracking.track_buffer", "must be >= 0");

  if (cfg.crowd.crowd_mode_threshold < 0) throw ConfigError("crowd.crowd_mode_threshold", "must be >= 0");
  if (!std::isfinite(cfg.crowd.high_density_threshold) || cfg.crowd.high_density_threshold < 0.f)
    throw ConfigError("crowd.high_density_threshold", "must be >= 0");

  if (cfg.counting_line.start == cfg.counting_line.end)
    throw ConfigError("counting_line", "start and end must differ");

  std::set<std::string> ids;
  for (std::size_t i = 0; i < cfg.zones.size(); ++i) {
    const Zone& z = cfg.zones[i];
    const std::string zp = IndexPath("zones", i);
    if (z.id.empty()) throw ConfigError(PathJoin(zp, "id"), "must not be empty");
    if (!ids.insert(z.id).second) throw ConfigError(PathJoin(zp, "id"), "duplicate zone id '" + z.id + "'");
    if (z.points.size() < 3) throw ConfigError(PathJoin(zp, "points"), "a zone needs at least 3 points");
    if (z.capacity < 0) throw ConfigError(PathJoin(zp, "capacity"), "must be >= 0");
  }

  if (cfg.reporting.publish_interval_ms <= 0) throw ConfigError("reporting.publish_interval_ms", "must be > 0");
}

static AppConfig LoadFromRoot(const YAML::Node& root) {
  AppConfig cfg;

  LoadCamera(root, cfg.camera);
  LoadDetector(root, cfg.detector);
  LoadTracking(root, cfg.tracking);
  LoadCrowd(root, cfg.crowd);
  LoadCountingLine(root, cfg.counting_line);
  LoadZones(root, cfg.zones);
  LoadReporting(root, cfg.reporting);

  ValidateOrThrow(cfg);
  return cfg;
}

AppConfig LoadConfigFromYamlFile(const std::string& path) {
  YAML::Node root;

  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to load YAML file '") + path + "': " + e.what());
  }

  return LoadFromRoot(root);
}

AppConfig LoadConfigFromYamlString(const std::string& yaml) {
  YAML::Node root;

  try {
    root = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML: ") + e.what());
  }

  return LoadFromRoot(root);
}

AnalyzerSettings MakeAnalyzerSettings(const AppConfig& cfg) {
  AnalyzerSettings s;
  s.tracker.track_thresh = cfg.tracking.track_thresh;
  s.tracker.match_thresh = cfg.tracking.match_thresh;
  s.tracker.track_buffer = cfg.tracking.track_buffer;
  s.crowd.crowd_mode_threshold = cfg.crowd.crowd_mode_threshold;
  s.crowd.high_density_threshold = cfg.crowd.high_density_threshold;
  s.line = cfg.counting_line;
  s.zones = cfg.zones;
  s.log_events = cfg.reporting.log_events;
  return s;
}

} // namespace fta
