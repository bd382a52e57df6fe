#pragma once

#include <arrow/buffer.h>
#include <arrow/io/file.h>
#include <arrow/result.h>

#include <memory>
#include <string>

#include "internal/util/errors.hpp"

namespace inkvault::storage::common {

/*
  Helper: unwrap Arrow Result<T> or throw util::IOError
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw util::IOError(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw util::IOError(status.ToString());
}

/*
  Read entire file into buffer
*/
inline std::shared_ptr<arrow::Buffer> ReadAll(std::shared_ptr<arrow::io::RandomAccessFile> file) {
  auto size = Unwrap(file->GetSize());
  return Unwrap(file->Read(size));
}

/*
  Atomic replace:
      write tmp -> flush -> [fsync tmp] -> rename -> [fsync parent dir]

  With fsync false the data is only handed to the OS; a crash may lose the
  newest file but never exposes a partial one.
*/
void AtomicWrite(const std::string& final_path, const std::shared_ptr<arrow::Buffer>& buffer, bool fsync);

} // namespace inkvault::storage::common
