#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "executor.hpp"

namespace inkvault::runtime {

/*
  Single-threaded FIFO executor.

  One worker thread drains a blocking queue, so tasks never overlap and run
  in post order. A session gets one of these for its state and one for
  its durable appends.

  Stop() drains what is already queued, then joins; it must not be called
  from one of this executor's own tasks. Posts after Stop are dropped with
  a warning.
*/
class SerialExecutor final : public Executor {
 public:
  explicit SerialExecutor(std::string name);
  ~SerialExecutor() override;

  SerialExecutor(const SerialExecutor&)            = delete;
  SerialExecutor& operator=(const SerialExecutor&) = delete;

  void Start();
  void Stop();

  void Post(Task task) override;

 private:
  void Run();

  // blocking wait
  std::optional<Task> Dequeue();

  std::string name_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<Task>        queue_;
  bool                    shutdown_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace inkvault::runtime
