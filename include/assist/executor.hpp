#pragma once

#include <functional>
#include <memory>

namespace assist {

class Executor {
public:
  virtual ~Executor() = default;

  /// Schedules a task to run independently of the caller. Tasks own their state.
  virtual void spawn(std::function<void()> task) = 0;
};

/**
 * Runs every task on its own detached thread.
 */
std::shared_ptr<Executor> make_thread_executor();

}  // namespace assist
