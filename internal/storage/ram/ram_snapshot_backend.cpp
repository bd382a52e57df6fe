#include "ram_snapshot_backend.hpp"

#include <mutex>

#include "internal/util/errors.hpp"

namespace inkvault::storage {

/*
  Buffers are shared, never copied; callers hand over immutable bytes.
*/
void RamSnapshotBackend::WriteRecord(uint64_t index, const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync unused*/) {
  std::unique_lock lock(mutex_);
  if (!records_.emplace(index, buffer).second)
    throw util::IOError("record already exists at index " + std::to_string(index));
}

std::shared_ptr<arrow::Buffer> RamSnapshotBackend::ReadRecord(uint64_t index) {
  std::shared_lock lock(mutex_);

  auto it = records_.find(index);
  if (it == records_.end()) throw util::NotFound("no snapshot record at index " + std::to_string(index));

  return it->second;
}

std::vector<uint64_t> RamSnapshotBackend::ListRecords() {
  std::shared_lock lock(mutex_);

  std::vector<uint64_t> indices;
  indices.reserve(records_.size());
  for (const auto& [index, buffer] : records_) indices.push_back(index);
  return indices;
}

void RamSnapshotBackend::WriteBookmarks(const std::shared_ptr<arrow::Buffer>& buffer, bool /*fsync unused*/) {
  std::unique_lock lock(mutex_);
  bookmarks_ = buffer;
}

std::shared_ptr<arrow::Buffer> RamSnapshotBackend::ReadBookmarks() {
  std::shared_lock lock(mutex_);
  return bookmarks_;
}

} // namespace inkvault::storage
