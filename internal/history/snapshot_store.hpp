#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "inkvault/v1.hpp"
#include "internal/storage/snapshot_backend.hpp"

namespace inkvault::history {

struct SnapshotStoreOptions {
  // Index given to the first record of an empty session.
  uint64_t first_index = 0;
  bool     fsync       = true;

  // Stamped on every record; zero when unknown.
  inkvault::v1::ImageDimensions image_dimensions;
};

/*
  Append-only log of annotation states for one session (the live sequence).

  Indices are assigned here: max(existing) + 1, or first_index when empty.
  The index list is loaded from the backend once at construction and kept
  in memory, so enumeration and neighbour queries never touch storage.

  Thread safety:
    Append may run on the append worker while reads run on the session
    executor. Appends are serialized against each other; the index list
    is guarded separately so readers never wait on a slow write.
*/
class SnapshotStore {
 public:
  SnapshotStore(storage::SnapshotBackendPtr backend, SnapshotStoreOptions options);

  SnapshotStore(const SnapshotStore&)            = delete;
  SnapshotStore& operator=(const SnapshotStore&) = delete;

  /*
    Durably store `state` and return its index.

    Throws util::IOError; a failed append does not consume the index.
  */
  uint64_t Append(const inkvault::v1::AnnotationState& state);

  // Throws util::NotFound / util::SerializationError.
  inkvault::v1::AnnotationState  Read(uint64_t index) const;
  inkvault::v1::SnapshotRecord   ReadRecord(uint64_t index) const;

  std::vector<uint64_t> ListIndices() const;

  bool                    Contains(uint64_t index) const;
  std::optional<uint64_t> Latest() const;
  std::size_t             Size() const;

  // Live-sequence neighbours, strict. nullopt at either end.
  std::optional<uint64_t> PredecessorOf(uint64_t index) const;
  std::optional<uint64_t> SuccessorOf(uint64_t index) const;

 private:
  storage::SnapshotBackendPtr backend_;
  SnapshotStoreOptions        options_;

  std::mutex append_mutex_;

  mutable std::mutex    index_mutex_;
  std::vector<uint64_t> indices_;
};

} // namespace inkvault::history
