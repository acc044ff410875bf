#include "core/yolo_detector.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <iostream>
#include <vector>

#include <opencv2/imgproc.hpp>

#include "core/geometry.hpp"

namespace fta {

static inline float Clamp(float v, float lo, float hi) {
  return std::max(lo, std::min(hi, v));
}

YoloDetector::YoloDetector(Params p) : p_(std::move(p)) {
  try {
    sess_opts_.SetIntraOpNumThreads(p_.intra_op_threads);
    sess_opts_.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

    session_ = std::make_unique<Ort::Session>(env_, p_.onnx_path.c_str(), sess_opts_);

    {
      auto in = session_->GetInputNameAllocated(0, allocator_);
      input_name_ = in ? std::string(in.get()) : std::string{};
    }
    {
      auto out = session_->GetOutputNameAllocated(0, allocator_);
      output_name_ = out ? std::string(out.get()) : std::string{};
    }

    loaded_ = !input_name_.empty() && !output_name_.empty();
    if (loaded_) std::cout << "YOLO model loaded: " << p_.onnx_path << std::endl;
  } catch (const Ort::Exception& e) {
    std::cerr << "ONNX Runtime init failed for '" << p_.onnx_path << "': " << e.what() << "\n";
    loaded_ = false;
  }
}

DetectionList YoloDetector::detect(const Frame& frame) {
  DetectionList out;
  if (!loaded_ || !session_ || frame.empty()) return out;

  const cv::Mat& img = frame.image;

  cv::Mat resized;
  cv::resize(img, resized, cv::Size(p_.input_w, p_.input_h), 0, 0, cv::INTER_LINEAR);

  cv::Mat rgb;
  cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);

  cv::Mat f32;
  rgb.convertTo(f32, CV_32F, 1.0 / 255.0);

  // HWC -> CHW
  std::vector<float> input_tensor(1 * 3 * p_.input_h * p_.input_w);
  {
    std::vector<cv::Mat> ch(3);
    cv::split(f32, ch);
    const int hw = p_.input_h * p_.input_w;
    for (int c = 0; c < 3; ++c) {
      std::memcpy(input_tensor.data() + c * hw, ch[c].data, hw * sizeof(float));
    }
  }

  std::array<int64_t, 4> in_shape{1, 3, p_.input_h, p_.input_w};
  auto mem_info = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);

  Ort::Value in = Ort::Value::CreateTensor<float>(
      mem_info, input_tensor.data(), input_tensor.size(), in_shape.data(), in_shape.size());

  const char* in_names[] = {input_name_.c_str()};
  const char* out_names[] = {output_name_.c_str()};

  // Ort::Exception propagates, the analytics stage drops the frame
  std::vector<Ort::Value> ort_out = session_->Run(Ort::RunOptions{nullptr}, in_names, &in, 1, out_names, 1);

  if (ort_out.empty() || !ort_out[0].IsTensor()) return out;

  auto& t = ort_out[0];
  auto shape = t.GetTensorTypeAndShapeInfo().GetShape();
  if (shape.size() != 3 || shape[0] != 1) return out;

  const float* data = t.GetTensorData<float>();
  const int A = static_cast<int>(shape[1]);
  const int B = static_cast<int>(shape[2]);

  // Channels are the short axis
  const bool layout_CxN = (A < B);
  const int C = layout_CxN ? A : B;
  const int N = layout_CxN ? B : A;
  if (C < 5) return out;

  const int num_classes = C - 4;

  auto at = [&](int c, int n) -> float {
    if (layout_CxN) return data[c * N + n];
    return data[n * C + c];
  };

  const float sx = static_cast<float>(img.cols) / static_cast<float>(p_.input_w);
  const float sy = static_cast<float>(img.rows) / static_cast<float>(p_.input_h);
  const float max_x = static_cast<float>(img.cols - 1);
  const float max_y = static_cast<float>(img.rows - 1);

  DetectionList cands;
  cands.reserve(256);

  for (int i = 0; i < N; ++i) {
    int best_cls = -1;
    float best = 0.f;
    if (p_.person_only) {
      best_cls = kPersonClassId;
      best = at(4 + kPersonClassId, i);
    } else {
      for (int c = 0; c < num_classes; ++c) {
        const float s = at(4 + c, i);
        if (s > best) { best = s; best_cls = c; }
      }
    }

    if (best < p_.conf_thresh) continue;

    const float cx = at(0, i) * sx;
    const float cy = at(1, i) * sy;
    const float w  = at(2, i) * sx;
    const float h  = at(3, i) * sy;

    Detection d;
    d.bbox.left = Clamp(cx - 0.5f * w, 0.f, max_x);
    d.bbox.top = Clamp(cy - 0.5f * h, 0.f, max_y);
    d.bbox.right = Clamp(cx + 0.5f * w, 0.f, max_x);
    d.bbox.bottom = Clamp(cy + 0.5f * h, 0.f, max_y);
    if (d.bbox.width() <= 1.f || d.bbox.height() <= 1.f) continue;

    d.confidence = best;
    d.class_id = best_cls;
    cands.push_back(d);
  }

  std::sort(cands.begin(), cands.end(),
            [](const Detection& a, const Detection& b) { return a.confidence > b.confidence; });

  // Greedy NMS, class agnostic
  out.reserve(cands.size());
  for (const auto& c : cands) {
    bool keep = true;
    for (const auto& k : out) {
      if (IoU(c.bbox, k.bbox) > p_.nms_thresh) { keep = false; break; }
    }
    if (keep) out.push_back(c);
  }

  return out;
}

} // namespace fta
