#include "courier/thread-pool.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "courier/exception.hpp"
#include "courier/invalid_argument_exception.hpp"
#include "courier/log.hpp"

namespace courier {

ThreadPool::ThreadPool(uint32_t nbThreads) : _state(std::make_shared<State>()) {
  if (nbThreads == 0) {
    throw invalid_argument("ThreadPool needs at least one thread");
  }
  _threads.reserve(nbThreads);
  for (uint32_t threadPos = 0; threadPos < nbThreads; ++threadPos) {
    _threads.emplace_back([state = _state] { WorkerLoop(state); });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::scoped_lock lock(_state->mutex);
    _state->stopping = true;
  }
  _state->taskCv.notify_all();
  const auto currentThreadId = std::this_thread::get_id();
  for (auto &thread : _threads) {
    if (!thread.joinable()) {
      continue;
    }
    if (thread.get_id() == currentThreadId) {
      // destroyed by one of its own tasks
      log::debug("ThreadPool destroyed from its own worker, detaching it");
      thread.detach();
    } else {
      thread.join();
    }
  }
}

void ThreadPool::submit(Task task) {
  {
    std::scoped_lock lock(_state->mutex);
    if (_state->stopping) {
      throw exception("ThreadPool is stopping, cannot accept new tasks");
    }
    _state->tasks.push(std::move(task));
  }
  _state->taskCv.notify_one();
}

void ThreadPool::waitAll() {
  std::unique_lock lock(_state->mutex);
  _state->idleCv.wait(lock, [this] { return _state->tasks.empty() && _state->nbActiveTasks == 0; });
}

void ThreadPool::WorkerLoop(const std::shared_ptr<State> &state) {
  while (true) {
    Task task;
    {
      std::unique_lock lock(state->mutex);
      state->taskCv.wait(lock, [&state] { return state->stopping || !state->tasks.empty(); });
      if (state->tasks.empty()) {
        // stopping and nothing left to run
        return;
      }
      task = std::move(state->tasks.front());
      state->tasks.pop();
      ++state->nbActiveTasks;
    }

    try {
      task();
    } catch (const std::exception &ex) {
      log::error("Uncaught exception in ThreadPool task: {}", ex.what());
    }
    // captured state is released before the task is reported as done
    task = nullptr;

    {
      std::scoped_lock lock(state->mutex);
      --state->nbActiveTasks;
    }
    state->idleCv.notify_all();
  }
}

}  // namespace courier
