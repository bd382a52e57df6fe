#include "bookmark_index.hpp"

#include <iterator>
#include <string>

#include "inkvault/v1.hpp"
#include "internal/history/snapshot_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace inkvault::history {

using inkvault::observability::IndexField;
using inkvault::observability::IntField;

BookmarkIndex::BookmarkIndex(storage::SnapshotBackendPtr backend, const SnapshotStore& store, bool fsync)
    : backend_(std::move(backend)), store_(store), fsync_(fsync) {
  Load();
}

void BookmarkIndex::Load() {
  auto buffer = backend_->ReadBookmarks();
  if (!buffer) return;

  inkvault::v1::BookmarkList list;
  if (!list.ParseFromArray(buffer->data(), static_cast<int>(buffer->size()))) {
    throw util::SerializationError("bookmark list is not valid");
  }

  for (auto index : list.indices()) {
    if (!store_.Contains(index)) {
      INKVAULT_LOG_WARN("dropping bookmark without snapshot", {IndexField("index", index)});
      continue;
    }
    marks_.insert(index);
  }
}

void BookmarkIndex::Persist() const {
  inkvault::v1::BookmarkList list;
  for (auto index : marks_) list.add_indices(index);

  std::string bytes;
  if (!list.SerializeToString(&bytes)) throw util::IOError("failed to encode bookmark list");

  backend_->WriteBookmarks(arrow::Buffer::FromString(std::move(bytes)), fsync_);
}

bool BookmarkIndex::Mark(uint64_t index) {
  if (!store_.Contains(index)) {
    throw util::NotFound("cannot bookmark missing snapshot " + std::to_string(index));
  }

  if (!marks_.insert(index).second) return false;

  try {
    Persist();
  } catch (...) {
    marks_.erase(index);
    throw;
  }

  INKVAULT_LOG_INFO("bookmark added", {IndexField("index", index), IntField("bookmarks", static_cast<int64_t>(marks_.size()))});
  return true;
}

bool BookmarkIndex::IsMarked(uint64_t index) const {
  return marks_.count(index) != 0;
}

bool BookmarkIndex::HasPredecessor(uint64_t index) const {
  return marks_.lower_bound(index) != marks_.begin();
}

bool BookmarkIndex::HasSuccessor(uint64_t index) const {
  return marks_.upper_bound(index) != marks_.end();
}

uint64_t BookmarkIndex::PredecessorOf(uint64_t index) const {
  auto it = marks_.lower_bound(index);
  if (it == marks_.begin()) {
    throw util::NoSuchTransition("no bookmark before " + std::to_string(index));
  }
  return *std::prev(it);
}

uint64_t BookmarkIndex::SuccessorOf(uint64_t index) const {
  auto it = marks_.upper_bound(index);
  if (it == marks_.end()) {
    throw util::NoSuchTransition("no bookmark after " + std::to_string(index));
  }
  return *it;
}

std::vector<uint64_t> BookmarkIndex::List() const {
  return {marks_.begin(), marks_.end()};
}

} // namespace inkvault::history
