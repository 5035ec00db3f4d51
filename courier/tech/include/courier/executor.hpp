#pragma once

#include <functional>

namespace courier {

// Execution context accepting units of work.
// Implementations must never run the submitted task on the calling stack of submit(), and may throw if they cannot
// accept it anymore.
class Executor {
 public:
  using Task = std::function<void()>;

  Executor() noexcept = default;

  Executor(const Executor &) = delete;
  Executor(Executor &&) = delete;
  Executor &operator=(const Executor &) = delete;
  Executor &operator=(Executor &&) = delete;

  virtual ~Executor() = default;

  virtual void submit(Task task) = 0;
};

}  // namespace courier
