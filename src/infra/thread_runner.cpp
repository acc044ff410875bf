#include "infra/thread_runner.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace fta {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

ThreadRunner::~ThreadRunner() {
  request_stop();
  join();
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_relaxed);
  failed_.store(false, std::memory_order_release);
  global_stop_ = global_stop;
  running_.store(true, std::memory_order_release);

  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
    try {
      fn(global_stop_, local_stop_);
    } catch (const std::exception& e) {
      record_failure(e.what());
    }
    running_.store(false, std::memory_order_release);
  });
}

void ThreadRunner::record_failure(const std::string& what) {
  {
    std::lock_guard<std::mutex> lock(error_mu_);
    error_ = what;
  }
  failed_.store(true, std::memory_order_release);
  std::cerr << name_ << " thread failed: " << what << std::endl;
}

std::string ThreadRunner::error() const {
  std::lock_guard<std::mutex> lock(error_mu_);
  return error_;
}

void ThreadRunner::request_stop() {
  local_stop_.store(true, std::memory_order_relaxed);
}

bool ThreadRunner::stop_requested() const {
  return ShouldStop(global_stop_, local_stop_);
}

void ThreadRunner::join() {
  if (thread_.joinable()) thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

} // namespace fta
