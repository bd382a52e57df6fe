#include "arrow_utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace inkvault::storage::common {

namespace {

void SyncDescriptor(int fd, const std::string& what) {
  if (::fsync(fd) != 0) throw util::IOError("fsync " + what + ": " + std::strerror(errno));
}

// Makes a completed rename survive a crash.
void SyncDirectory(const std::filesystem::path& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) throw util::IOError("open " + dir.string() + ": " + std::strerror(errno));

  const int rc    = ::fsync(fd);
  const int error = errno;
  ::close(fd);
  if (rc != 0) throw util::IOError("fsync " + dir.string() + ": " + std::strerror(error));
}

} // namespace

void AtomicWrite(const std::string& final_path, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync) {
  const auto tmp_path = final_path + ".tmp";

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    Unwrap(out->Flush());

    if (fsync) SyncDescriptor(out->file_descriptor(), tmp_path);

    Unwrap(out->Close());
  } catch (const util::IOError&) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw util::IOError("rename " + tmp_path + " -> " + final_path + ": " + ec.message());
  }

  if (fsync) SyncDirectory(std::filesystem::path(final_path).parent_path());
}

} // namespace inkvault::storage::common
