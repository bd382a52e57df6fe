#include "disk_snapshot_backend.hpp"

#include <arrow/io/file.h>
#include <algorithm>
#include <filesystem>
#include <system_error>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace inkvault::storage {

using namespace inkvault::storage::common;

DiskSnapshotBackend::DiskSnapshotBackend(std::filesystem::path session_root)
    : root_(std::move(session_root)) {

  std::error_code ec;
  std::filesystem::create_directories(root_ / kLiveDirectory, ec);
  if (ec)
    throw util::IOError("cannot create session directory " + root_.string() + ": " + ec.message());
}

void DiskSnapshotBackend::WriteRecord(uint64_t index,
                                      const std::shared_ptr<arrow::Buffer>& buffer,
                                      bool fsync) {

  auto final_path = RecordPath(root_, index);

  // rename() would silently replace; records are immutable
  if (std::filesystem::exists(final_path))
    throw util::IOError("record already exists: " + final_path.string());

  AtomicWrite(final_path.string(), buffer, fsync);
}

std::shared_ptr<arrow::Buffer> DiskSnapshotBackend::ReadRecord(uint64_t index) {

  auto path = RecordPath(root_, index);

  if (!std::filesystem::exists(path))
    throw util::NotFound("no snapshot record at index " + std::to_string(index));

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

/*
  Enumerate live/ and keep names that parse as record file names.
*/
std::vector<uint64_t> DiskSnapshotBackend::ListRecords() {

  std::vector<uint64_t> indices;

  std::error_code ec;
  for (std::filesystem::directory_iterator it(root_ / kLiveDirectory, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    if (auto index = ParseRecordFileName(it->path().filename().string())) indices.push_back(*index);
  }
  if (ec)
    throw util::IOError("cannot list " + (root_ / kLiveDirectory).string() + ": " + ec.message());

  std::sort(indices.begin(), indices.end());
  return indices;
}

void DiskSnapshotBackend::WriteBookmarks(const std::shared_ptr<arrow::Buffer>& buffer,
                                         bool fsync) {
  AtomicWrite((root_ / kBookmarksFile).string(), buffer, fsync);
}

std::shared_ptr<arrow::Buffer> DiskSnapshotBackend::ReadBookmarks() {

  auto path = root_ / kBookmarksFile;
  if (!std::filesystem::exists(path))
    return nullptr;

  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  return ReadAll(file);
}

}
