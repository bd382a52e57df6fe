#pragma once

#include <map>
#include <memory>
#include <shared_mutex>

#include <arrow/buffer.h>

#include "internal/storage/snapshot_backend.hpp"

namespace inkvault::storage {

/*
  RAM session storage.

  Backed by Arrow buffers stored in-memory. Used by tests and by sessions
  that do not need to survive the process.

  Thread safety:
    - shared reads
    - exclusive writes
*/

class RamSnapshotBackend : public SnapshotBackend {
public:
  RamSnapshotBackend() = default;
  ~RamSnapshotBackend() override = default;

  void WriteRecord(uint64_t index,
                   const std::shared_ptr<arrow::Buffer>& buffer,
                   bool fsync) override;

  std::shared_ptr<arrow::Buffer> ReadRecord(uint64_t index) override;

  std::vector<uint64_t> ListRecords() override;

  void WriteBookmarks(const std::shared_ptr<arrow::Buffer>& buffer,
                      bool fsync) override;

  std::shared_ptr<arrow::Buffer> ReadBookmarks() override;

private:
  mutable std::shared_mutex mutex_;
  std::map<uint64_t, std::shared_ptr<arrow::Buffer>> records_;
  std::shared_ptr<arrow::Buffer> bookmarks_;
};

} // namespace inkvault::storage
