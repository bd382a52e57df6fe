#include "snapshot_store.hpp"

#include <algorithm>
#include <iterator>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace inkvault::history {

using namespace inkvault::v1;
using inkvault::observability::IndexField;
using inkvault::observability::IntField;

SnapshotStore::SnapshotStore(storage::SnapshotBackendPtr backend, SnapshotStoreOptions options)
    : backend_(std::move(backend)), options_(std::move(options)) {
  indices_ = backend_->ListRecords();
}

// ------------------------------------------------------------
// Append
// ------------------------------------------------------------

uint64_t SnapshotStore::Append(const AnnotationState& state) {
  std::lock_guard append_lock(append_mutex_);

  uint64_t index = options_.first_index;
  {
    std::lock_guard lock(index_mutex_);
    if (!indices_.empty()) index = indices_.back() + 1;
  }

  SnapshotRecord record;
  record.set_index(index);
  *record.mutable_created_at()       = util::ToProto(util::WallNow());
  *record.mutable_state()            = state;
  *record.mutable_image_dimensions() = options_.image_dimensions;

  std::string bytes;
  if (!record.SerializeToString(&bytes)) {
    throw util::IOError("failed to encode snapshot " + std::to_string(index));
  }

  try {
    backend_->WriteRecord(index, arrow::Buffer::FromString(std::move(bytes)), options_.fsync);
  } catch (const util::IOError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::IOError("snapshot " + std::to_string(index) + " write failed: " + e.what());
  }

  {
    std::lock_guard lock(index_mutex_);
    indices_.push_back(index);
  }

  INKVAULT_LOG_DEBUG("snapshot appended", {IndexField("index", index), IntField("strokes", state.strokes_size())});
  return index;
}

// ------------------------------------------------------------
// Read
// ------------------------------------------------------------

SnapshotRecord SnapshotStore::ReadRecord(uint64_t index) const {
  auto buffer = backend_->ReadRecord(index);

  SnapshotRecord record;
  if (!record.ParseFromArray(buffer->data(), static_cast<int>(buffer->size()))) {
    throw util::SerializationError("snapshot " + std::to_string(index) + " is not a valid record");
  }
  if (record.index() != index) {
    throw util::SerializationError("snapshot " + std::to_string(index) + " claims index " + std::to_string(record.index()));
  }
  return record;
}

AnnotationState SnapshotStore::Read(uint64_t index) const {
  return ReadRecord(index).state();
}

// ------------------------------------------------------------
// Index queries
// ------------------------------------------------------------

std::vector<uint64_t> SnapshotStore::ListIndices() const {
  std::lock_guard lock(index_mutex_);
  return indices_;
}

bool SnapshotStore::Contains(uint64_t index) const {
  std::lock_guard lock(index_mutex_);
  return std::binary_search(indices_.begin(), indices_.end(), index);
}

std::optional<uint64_t> SnapshotStore::Latest() const {
  std::lock_guard lock(index_mutex_);
  if (indices_.empty()) return std::nullopt;
  return indices_.back();
}

std::size_t SnapshotStore::Size() const {
  std::lock_guard lock(index_mutex_);
  return indices_.size();
}

std::optional<uint64_t> SnapshotStore::PredecessorOf(uint64_t index) const {
  std::lock_guard lock(index_mutex_);
  auto it = std::lower_bound(indices_.begin(), indices_.end(), index);
  if (it == indices_.begin()) return std::nullopt;
  return *std::prev(it);
}

std::optional<uint64_t> SnapshotStore::SuccessorOf(uint64_t index) const {
  std::lock_guard lock(index_mutex_);
  auto it = std::upper_bound(indices_.begin(), indices_.end(), index);
  if (it == indices_.end()) return std::nullopt;
  return *it;
}

} // namespace inkvault::history
