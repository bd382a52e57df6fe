#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "executor.hpp"

namespace inkvault::runtime {

/*
  Recurring task source.

  The timer thread never runs `task` itself; it posts it to `executor`
  once per interval, so the task executes alongside everything else the
  executor owns. Ticks are not coalesced or caught up after a stall.
*/
class PeriodicTimer {
 public:
  PeriodicTimer(std::shared_ptr<Executor> executor, std::chrono::steady_clock::duration interval, Task task);
  ~PeriodicTimer();

  PeriodicTimer(const PeriodicTimer&)            = delete;
  PeriodicTimer& operator=(const PeriodicTimer&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<Executor>           executor_;
  std::chrono::steady_clock::duration interval_;
  Task                                task_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace inkvault::runtime
