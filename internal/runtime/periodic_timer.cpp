#include "periodic_timer.hpp"

namespace inkvault::runtime {

PeriodicTimer::PeriodicTimer(std::shared_ptr<Executor> executor, std::chrono::steady_clock::duration interval, Task task)
    : executor_(std::move(executor)), interval_(interval), task_(std::move(task)) {}

PeriodicTimer::~PeriodicTimer() {
  Stop();
}

void PeriodicTimer::Start() {
  {
    std::lock_guard lock(mutex_);
    if (running_) return;
    running_ = true;
  }
  thread_ = std::thread(&PeriodicTimer::Run, this);
}

void PeriodicTimer::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void PeriodicTimer::Run() {
  auto next = std::chrono::steady_clock::now() + interval_;

  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_until(lock, next, [&] { return !running_; })) break;

    next += interval_;
    const auto now = std::chrono::steady_clock::now();
    if (next < now) next = now + interval_;

    lock.unlock();
    executor_->Post(task_);
    lock.lock();
  }
}

} // namespace inkvault::runtime
