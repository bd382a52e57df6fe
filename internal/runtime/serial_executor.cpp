#include "serial_executor.hpp"

#include "internal/observability/logging.hpp"

namespace inkvault::runtime {

using inkvault::observability::ErrorField;
using inkvault::observability::StringField;

SerialExecutor::SerialExecutor(std::string name) : name_(std::move(name)) {}

SerialExecutor::~SerialExecutor() {
  Stop();
}

void SerialExecutor::Start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = false;
  }
  thread_ = std::thread(&SerialExecutor::Run, this);
}

void SerialExecutor::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();

  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void SerialExecutor::Post(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      INKVAULT_LOG_WARN("task posted to stopped executor dropped", {StringField("executor", name_)});
      return;
    }
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

std::optional<Task> SerialExecutor::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Task task = std::move(queue_.front());
  queue_.pop_front();
  return task;
}

void SerialExecutor::Run() {
  while (true) {
    auto task = Dequeue();
    if (!task)
      break;

    try {
      (*task)();
    }
    catch (const std::exception& e) {
      INKVAULT_LOG_ERROR("executor task failed", {StringField("executor", name_), ErrorField(e.what())});
    }
  }
}

} // namespace inkvault::runtime
