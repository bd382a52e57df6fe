#pragma once

#include <map>
#include <mutex>

#include "internal/db/api/status_repository.hpp"

namespace inkvault::db::memory {

class MemoryStatusRepository final : public db::StatusRepository {
 public:
  Result                             Upsert(const model::StatusRecord& record) override;
  std::optional<model::StatusRecord> Get(const std::string& image_name) override;
  std::vector<model::StatusRecord>   List() override;
  model::StatusCounts                Count() override;

 private:
  std::mutex                                 mutex_;
  std::map<std::string, model::StatusRecord> records_;
};

} // namespace inkvault::db::memory
