#pragma once

#include <cstdint>
#include <set>
#include <vector>

#include "internal/storage/snapshot_backend.hpp"

namespace inkvault::history {

class SnapshotStore;

/*
  Indices the user explicitly marked ("done" / saved view).

  A sparse, ordered subset of the live sequence, navigable on its own.
  Backed by an ordered set, so membership and neighbour queries are
  O(log n). Every successful Mark rewrites bookmarks.pb atomically.

  Not thread safe: owned by the session executor.
*/
class BookmarkIndex {
 public:
  BookmarkIndex(storage::SnapshotBackendPtr backend, const SnapshotStore& store, bool fsync);

  /*
    Returns true when `index` was newly marked, false when it already was.

    Throws util::NotFound if `index` is not in the live sequence,
    util::IOError if the bookmark list could not be persisted (the mark
    is not kept in that case).
  */
  bool Mark(uint64_t index);

  bool IsMarked(uint64_t index) const;

  // Strict neighbours. Throw util::NoSuchTransition when none exists.
  uint64_t PredecessorOf(uint64_t index) const;
  uint64_t SuccessorOf(uint64_t index) const;

  bool HasPredecessor(uint64_t index) const;
  bool HasSuccessor(uint64_t index) const;

  std::vector<uint64_t> List() const;
  std::size_t           Size() const { return marks_.size(); }

 private:
  void Load();
  void Persist() const;

  storage::SnapshotBackendPtr backend_;
  const SnapshotStore&        store_;
  bool                        fsync_;

  std::set<uint64_t> marks_;
};

} // namespace inkvault::history
