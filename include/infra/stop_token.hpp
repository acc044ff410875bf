#pragma once
#include <atomic>
#include <chrono>
#include <thread>

/*
    Cooperative shutdown for the pipeline threads.

    The application owns one StopSource for the whole system. Each stage thread gets a StopToken (read-only view of
    that flag) and the local flag of its own ThreadRunner, and leaves its loop as soon as either one is set.
    ShouldStop and SleepUnlessStopped are the two checks every stage loop is written with.
*/

namespace fta {

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_relaxed);
  }

private:
  const std::atomic_bool* flag_ = nullptr;
};

class StopSource {
public:
  StopSource() = default;

  StopSource(const StopSource&) = delete;
  StopSource& operator=(const StopSource&) = delete;

  StopToken token() const { return StopToken(&stop_); }

  void request_stop() { stop_.store(true, std::memory_order_relaxed); }

  bool stop_requested() const { return stop_.load(std::memory_order_relaxed); }

private:
  std::atomic_bool stop_{false};
};

inline bool ShouldStop(const StopToken& global, const std::atomic_bool& local) {
  return global.stop_requested() || local.load(std::memory_order_relaxed);
}

// Sleep up to 'total' in short slices. Returns false if a stop was requested before the time was up
template <typename Rep, typename Period>
bool SleepUnlessStopped(const StopToken& global,
                        const std::atomic_bool& local,
                        std::chrono::duration<Rep, Period> total,
                        std::chrono::milliseconds slice = std::chrono::milliseconds(10)) {
  const auto deadline = std::chrono::steady_clock::now() + total;
  while (!ShouldStop(global, local)) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return true;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(left < slice ? left + std::chrono::milliseconds(1) : slice);
  }
  return false;
}

} // namespace fta
