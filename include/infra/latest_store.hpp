#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

/*
    LatestStore is how the analytics worker hands results to everything that only wants "the newest one".

    The worker writes a fresh AnalyticsSnapshot after every processed frame. Readers (the reporting stage, the console
    dashboard, tests) poll read_latest() at their own rate and never block the worker for longer than a copy.
    Older values are overwritten, nothing queues up behind a slow reader.

    version() increases on every write and clear(). read_if_newer() checks the version and copies the value under
    one lock, so a periodic reader never publishes the same snapshot twice.
*/

namespace fta {

template <typename T>
class LatestStore {
public:
  LatestStore() = default;

  LatestStore(const LatestStore&) = delete;
  LatestStore& operator=(const LatestStore&) = delete;

  void write(T value) {
    std::lock_guard<std::mutex> lock(mu_);
    latest_ = std::move(value);
    has_value_ = true;
    ++version_;
  }

  std::optional<T> read_latest() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!has_value_) return std::nullopt;
    return latest_;
  }

  // The stored value if it changed since *seen_version, which is then advanced. A clear() counts as a change but
  // yields nothing
  std::optional<T> read_if_newer(std::uint64_t* seen_version) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (version_ == *seen_version) return std::nullopt;
    *seen_version = version_;
    if (!has_value_) return std::nullopt;
    return latest_;
  }

  std::uint64_t version() const {
    std::lock_guard<std::mutex> lock(mu_);
    return version_;
  }

  bool has_value() const {
    std::lock_guard<std::mutex> lock(mu_);
    return has_value_;
  }

  // Forget the stored value, the version keeps counting so readers still see a change
  void clear() {
    std::lock_guard<std::mutex> lock(mu_);
    latest_ = T{};
    has_value_ = false;
    ++version_;
  }

private:
  mutable std::mutex mu_;
  T latest_{};
  bool has_value_{false};
  std::uint64_t version_{0};
};

} // namespace fta
