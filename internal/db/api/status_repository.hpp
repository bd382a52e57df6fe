#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/status_record.hpp"
#include "result.hpp"

namespace inkvault::db {

/*
  Per-image status catalog shared by every session of a storage root.
  Implementations must be safe to call from several session executors.
*/
class StatusRepository {
 public:
  virtual ~StatusRepository() = default;

  virtual Result Upsert(const model::StatusRecord& record) = 0;

  virtual std::optional<model::StatusRecord> Get(const std::string& image_name) = 0;

  // ordered by image name
  virtual std::vector<model::StatusRecord> List() = 0;

  virtual model::StatusCounts Count() = 0;
};

} // namespace inkvault::db
