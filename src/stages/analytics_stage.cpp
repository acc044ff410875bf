#include "stages/analytics_stage.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace fta {

AnalyticsStage::AnalyticsStage(StageMetrics* metrics,
                               std::shared_ptr<Detector> detector,
                               std::shared_ptr<TrafficAnalyzer> analyzer,
                               std::shared_ptr<LatestStore<AnalyticsSnapshot>> snapshots)
    : Stage("analytics_stage"),
      metrics_(metrics),
      detector_(std::move(detector)),
      analyzer_(std::move(analyzer)),
      snapshots_(std::move(snapshots)) {}

bool AnalyticsStage::try_submit(Frame frame) {
  bool expected = false;
  if (!busy_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    if (metrics_) metrics_->on_drop();
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    pending_frame_ = std::move(frame);
  }
  cv_.notify_one();
  return true;
}

void AnalyticsStage::request_reset() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    reset_requested_ = true;
  }
  cv_.notify_one();
}

void AnalyticsStage::request_settings(AnalyzerSettings settings) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    pending_settings_ = std::move(settings);
  }
  cv_.notify_one();
}

void AnalyticsStage::apply_pending_control() {
  std::optional<AnalyzerSettings> settings;
  bool reset = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    settings.swap(pending_settings_);
    reset = reset_requested_;
    reset_requested_ = false;
  }

  if (settings) analyzer_->apply_settings(*settings);
  if (reset) {
    analyzer_->reset();
    snapshots_->clear();
  }
}

void AnalyticsStage::process(const Frame& frame) {
  const auto t0 = std::chrono::steady_clock::now();

  try {
    const DetectionList detections = detector_ ? detector_->detect(frame) : DetectionList{};
    AnalyticsSnapshot snap = analyzer_->process(frame, detections, t0);
    snapshots_->write(std::move(snap));

    processed_.fetch_add(1, std::memory_order_relaxed);
    if (metrics_) {
      const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0).count();
      metrics_->on_item(static_cast<std::uint64_t>(ns));
    }
  } catch (const std::exception& e) {
    failed_.fetch_add(1, std::memory_order_relaxed);
    if (metrics_) metrics_->on_failure();
    std::cerr << "analytics_stage: frame " << frame.sequence_id << " skipped: " << e.what() << std::endl;
  }
}

void AnalyticsStage::run(const StopToken& global, const std::atomic_bool& local) {
  while (!ShouldStop(global, local)) {
    std::optional<Frame> frame;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, std::chrono::milliseconds(5), [&] {
        return pending_frame_.has_value() || pending_settings_.has_value() || reset_requested_;
      });
      frame.swap(pending_frame_);
    }

    // Control requests land between frames
    apply_pending_control();

    if (!frame) continue;

    process(*frame);
    busy_.store(false, std::memory_order_release);
  }

  // A frame claimed but never processed must not leave the flag stuck
  std::lock_guard<std::mutex> lock(mu_);
  if (pending_frame_) {
    pending_frame_.reset();
    busy_.store(false, std::memory_order_release);
  }
}

} // namespace fta
