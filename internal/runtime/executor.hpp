#pragma once

#include <functional>

namespace inkvault::runtime {

using Task = std::function<void()>;

/*
  Where work for a session runs.

  Everything that touches session state is posted to one executor, so the
  state itself needs no locks.
*/
class Executor {
 public:
  virtual ~Executor() = default;

  virtual void Post(Task task) = 0;
};

/*
  Runs the task on the caller's thread before Post returns.
  Deterministic; used by tests and offline tools.
*/
class InlineExecutor final : public Executor {
 public:
  void Post(Task task) override {
    task();
  }
};

} // namespace inkvault::runtime
