#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "core/detector.hpp"

#include <onnxruntime/onnxruntime_cxx_api.h>

namespace fta {

// YOLOv8 style ONNX model (output [1, 4 + classes, N] or [1, N, 4 + classes]) run on the CPU with ONNX Runtime.
// Keeps only the person class when person_only is set
class YoloDetector final : public Detector {
public:
  struct Params {
    std::string onnx_path;
    int input_w{640};
    int input_h{640};
    float conf_thresh{0.45f};
    float nms_thresh{0.5f};
    bool person_only{true};
    int intra_op_threads{1};
  };

  explicit YoloDetector(Params p);

  bool is_loaded() const { return loaded_; }

  DetectionList detect(const Frame& frame) override;

private:
  Params p_;
  bool loaded_{false};

  Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "fta-yolo"};
  Ort::SessionOptions sess_opts_{};
  std::unique_ptr<Ort::Session> session_;
  Ort::AllocatorWithDefaultOptions allocator_;

  std::string input_name_;
  std::string output_name_;
};

} // namespace fta
