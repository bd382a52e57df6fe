#include "append_worker.hpp"

#include "internal/history/snapshot_store.hpp"
#include "internal/util/errors.hpp"

namespace inkvault::session {

AppendWorker::AppendWorker(history::SnapshotStore& store, std::shared_ptr<runtime::Executor> io, std::shared_ptr<runtime::Executor> session)
    : store_(store), io_(std::move(io)), session_(std::move(session)) {}

void AppendWorker::Submit(inkvault::v1::AnnotationState state, Completion done) {
  io_->Post([this, state = std::move(state), done = std::move(done)]() mutable {
    AppendResult result;
    try {
      result.index = store_.Append(state);
    } catch (const util::IOError& e) {
      result.error = e.what();
    }
    result.state = std::move(state);

    session_->Post([done = std::move(done), result = std::move(result)]() mutable { done(std::move(result)); });
  });
}

} // namespace inkvault::session
