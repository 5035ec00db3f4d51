#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

#include "courier/exception.hpp"
#include "courier/executor.hpp"

namespace courier::test {

// Executor queuing its tasks until the test runs them with runAll().
class ManualExecutor final : public Executor {
 public:
  void submit(Task task) override {
    std::scoped_lock lock(_mutex);
    if (_refuseTasks) {
      throw exception("ManualExecutor refuses new tasks");
    }
    _tasks.push_back(std::move(task));
    ++_nbSubmitted;
  }

  // Runs queued tasks, including the ones submitted meanwhile, until the queue is empty.
  // Returns the number of tasks run.
  std::size_t runAll() {
    std::size_t nbRun = 0;
    while (true) {
      Task task;
      {
        std::scoped_lock lock(_mutex);
        if (_tasks.empty()) {
          return nbRun;
        }
        task = std::move(_tasks.front());
        _tasks.pop_front();
      }
      task();
      ++nbRun;
    }
  }

  // Makes submit() throw, as an executor shutting down would.
  void setRefuseTasks(bool refuseTasks = true) {
    std::scoped_lock lock(_mutex);
    _refuseTasks = refuseTasks;
  }

  [[nodiscard]] std::size_t nbPending() const {
    std::scoped_lock lock(_mutex);
    return _tasks.size();
  }

  [[nodiscard]] std::size_t nbSubmitted() const {
    std::scoped_lock lock(_mutex);
    return _nbSubmitted;
  }

 private:
  mutable std::mutex _mutex;
  std::deque<Task> _tasks;
  std::size_t _nbSubmitted{0};
  bool _refuseTasks{false};
};

}  // namespace courier::test
