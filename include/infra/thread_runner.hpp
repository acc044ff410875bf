#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one worker thread: start, local stop, join.

    The worker gets the global StopToken and the runner's own stop flag. An exception escaping the worker ends the
    thread, is logged with the runner's name and kept in error(), instead of taking the whole process down.
    The destructor requests a local stop and joins.
*/

namespace fta {

class ThreadRunner {
public:
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  ~ThreadRunner();

  // Throws std::runtime_error if the thread is already running
  void start(StopToken global_stop, Fn fn);

  // Stop this thread only
  void request_stop();
  bool stop_requested() const;

  void join();
  bool joinable() const;

  // True between start() and the worker function returning
  bool running() const { return running_.load(std::memory_order_acquire); }

  // Set when an exception ended the worker. error() holds its message
  bool failed() const { return failed_.load(std::memory_order_acquire); }
  std::string error() const;

  const std::string& name() const { return name_; }

private:
  void record_failure(const std::string& what);

  std::thread thread_;
  std::atomic_bool local_stop_{false};
  std::atomic_bool running_{false};
  std::atomic_bool failed_{false};
  StopToken global_stop_{};
  std::string name_{"thread"};

  mutable std::mutex error_mu_;
  std::string error_;
};

} // namespace fta
