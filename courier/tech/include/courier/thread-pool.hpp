#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "courier/executor.hpp"

namespace courier {

// Fixed size pool of worker threads, suitable as the blocking executor of an AsyncNetwork.
// Tasks are run in submission order. Destruction waits for the queued tasks to complete.
// The pool may be destroyed from one of its own tasks: the worker running it is then detached and exits once the
// queue is drained.
class ThreadPool final : public Executor {
 public:
  static constexpr uint32_t kDefaultNbThreads = 4U;

  explicit ThreadPool(uint32_t nbThreads = kDefaultNbThreads);

  ~ThreadPool() override;

  // Enqueues a task. Throws courier::exception if the pool is stopping.
  void submit(Task task) override;

  // Blocks until the queue is empty and no task is running.
  void waitAll();

  [[nodiscard]] std::size_t nbThreads() const noexcept { return _threads.size(); }

 private:
  // Shared with the workers, so that a detached worker never outlives it.
  struct State {
    std::queue<Task> tasks;
    std::mutex mutex;
    std::condition_variable taskCv;
    std::condition_variable idleCv;
    std::size_t nbActiveTasks{0};
    bool stopping{false};
  };

  static void WorkerLoop(const std::shared_ptr<State> &state);

  std::shared_ptr<State> _state;
  std::vector<std::thread> _threads;
};

}  // namespace courier
