#include "assist/executor.hpp"

#include <thread>
#include <utility>

namespace assist {
namespace {

class ThreadExecutor final : public Executor {
public:
  void spawn(std::function<void()> task) override {
    std::thread(std::move(task)).detach();
  }
};

}  // namespace

std::shared_ptr<Executor> make_thread_executor() {
  return std::make_shared<ThreadExecutor>();
}

}  // namespace assist
