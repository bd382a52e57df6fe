#pragma once

#include <filesystem>
#include <arrow/buffer.h>

#include "internal/storage/snapshot_backend.hpp"

namespace inkvault::storage {

/*
  Durable session storage using Arrow IO.

  Layout under the session root:
      live/00000.pb, live/00001.pb, ...
      bookmarks.pb

  Properties:
    - atomic replace writes (tmp + rename)
    - optional fsync
    - records are never overwritten
*/

class DiskSnapshotBackend final : public SnapshotBackend {
public:
  explicit DiskSnapshotBackend(std::filesystem::path session_root);

  void WriteRecord(uint64_t index,
                   const std::shared_ptr<arrow::Buffer>& buffer,
                   bool fsync) override;

  std::shared_ptr<arrow::Buffer> ReadRecord(uint64_t index) override;

  std::vector<uint64_t> ListRecords() override;

  void WriteBookmarks(const std::shared_ptr<arrow::Buffer>& buffer,
                      bool fsync) override;

  std::shared_ptr<arrow::Buffer> ReadBookmarks() override;

  const std::filesystem::path& Root() const { return root_; }

private:
  std::filesystem::path root_;
};

}
