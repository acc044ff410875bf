#include "stages/camera_stage.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace fta {

CameraStage::CameraStage(StageMetrics* metrics, CameraConfig cfg, FrameSink sink)
    : Stage("camera_stage"), metrics_(metrics), cfg_(std::move(cfg)), sink_(std::move(sink)) {}

void CameraStage::run(const StopToken& global, const std::atomic_bool& local) {
  const bool from_file = !cfg_.source.empty();

  cv::VideoCapture cap;
  if (from_file) {
    cap.open(cfg_.source);
  } else {
    cap.open(cfg_.device_index);
  }

  if (!cap.isOpened()) {
    std::cerr << "camera_stage: cannot open source '"
              << (from_file ? cfg_.source : std::to_string(cfg_.device_index)) << "'" << std::endl;
    finished_.store(true, std::memory_order_relaxed);
    return;
  }

  if (!from_file) {
    cap.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
    cap.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
    cap.set(cv::CAP_PROP_FPS, cfg_.fps);
  }

  // Files are paced at the configured fps, live devices pace themselves
  const auto file_period = std::chrono::microseconds(1000000 / cfg_.fps);

  while (!ShouldStop(global, local)) {
    const auto t0 = std::chrono::steady_clock::now();

    cv::Mat img;
    if (!cap.read(img)) {
      if (from_file) {
        std::cout << "camera_stage: end of " << cfg_.source << std::endl;
        finished_.store(true, std::memory_order_relaxed);
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      continue;
    }

    if (cfg_.flip_vertical) cv::flip(img, img, 0);
    if (cfg_.flip_horizontal) cv::flip(img, img, 1);

    Frame f;
    f.capture_time = std::chrono::steady_clock::now();
    f.sequence_id = next_id_++;
    f.image = std::move(img);

    const bool accepted = sink_(std::move(f));
    if (metrics_) {
      if (accepted) {
        const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count();
        metrics_->on_item(static_cast<std::uint64_t>(ns));
      } else {
        metrics_->on_drop();
      }
    }

    if (from_file) SleepUnlessStopped(global, local, file_period - (std::chrono::steady_clock::now() - t0));
  }
}

} // namespace fta
