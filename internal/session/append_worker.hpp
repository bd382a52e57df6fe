#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "inkvault/v1.hpp"
#include "internal/runtime/executor.hpp"

namespace inkvault::history {
class SnapshotStore;
}

namespace inkvault::session {

struct AppendResult {
  inkvault::v1::AnnotationState state;
  std::optional<uint64_t>       index;
  std::string                   error;

  bool ok() const {
    return index.has_value();
  }
};

/*
  Runs durable appends off the session executor.

  The write executes on `io`; its result is posted back to `session`, so
  completions are handled in order with everything else the session does.
  `io` must be serial: together with the scheduler's single in-flight rule
  that keeps indices strictly increasing and gap free.
*/
class AppendWorker {
 public:
  using Completion = std::function<void(AppendResult)>;

  AppendWorker(history::SnapshotStore& store, std::shared_ptr<runtime::Executor> io, std::shared_ptr<runtime::Executor> session);

  void Submit(inkvault::v1::AnnotationState state, Completion done);

 private:
  history::SnapshotStore&            store_;
  std::shared_ptr<runtime::Executor> io_;
  std::shared_ptr<runtime::Executor> session_;
};

} // namespace inkvault::session
