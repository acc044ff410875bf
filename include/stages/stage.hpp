#pragma once

#include <atomic>
#include <string>

#include "infra/stop_token.hpp"
#include "infra/thread_runner.hpp"

namespace fta {

/*
    A named pipeline step on its own thread. Subclasses implement run() as a loop over ShouldStop(global, local).

    Derived stages must call stop() before they are destroyed: the thread runs the derived run() and has to be
    joined while the derived object is still alive.
*/
class Stage {
public:
  explicit Stage(std::string name);
  virtual ~Stage();

  Stage(const Stage&) = delete;
  Stage& operator=(const Stage&) = delete;

  void start(StopToken global_stop);

  // Safe to call more than once, only the first call after start() joins and logs
  void stop();

  bool running() const { return runner_.running(); }

  // True if run() ended with an exception. The message was logged to stderr
  bool failed() const { return runner_.failed(); }

  const std::string& name() const { return name_; }

protected:
  virtual void run(const StopToken& global_stop,
                   const std::atomic_bool& local_stop) = 0;

private:
  std::string name_;
  ThreadRunner runner_;
};

} // namespace fta
