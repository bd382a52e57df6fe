#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace inkvault::storage {

/*
  Storage namespace of a single editing session.

  Holds two kinds of objects:
    records    -> one immutable blob per live-sequence index
    bookmarks  -> one small blob listing bookmarked indices, replaced whole

  Backends move opaque Arrow buffers; encoding belongs to the history layer.

  Implementations:
    DISK  -> <root>/live/00047.pb + <root>/bookmarks.pb
    RAM   -> in-memory map (tests, ephemeral sessions)
*/

class SnapshotBackend {
 public:
  virtual ~SnapshotBackend() = default;

  // ------------------------------------------------------------------
  // Records
  // ------------------------------------------------------------------
  /*
    Persist a record under `index`.

    Must be atomic: readers see either nothing or the whole record.
    Must refuse to replace an existing record.
    Throws util::IOError when the write cannot complete.
  */
  virtual void WriteRecord(uint64_t index, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  // Throws util::NotFound when no record exists at `index`.
  virtual std::shared_ptr<arrow::Buffer> ReadRecord(uint64_t index) = 0;

  // Every stored index, ascending.
  virtual std::vector<uint64_t> ListRecords() = 0;

  // ------------------------------------------------------------------
  // Bookmarks
  // ------------------------------------------------------------------
  // Atomic replace. Throws util::IOError.
  virtual void WriteBookmarks(const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) = 0;

  // nullptr when nothing was ever written.
  virtual std::shared_ptr<arrow::Buffer> ReadBookmarks() = 0;
};

using SnapshotBackendPtr = std::shared_ptr<SnapshotBackend>;

} // namespace inkvault::storage
