#pragma once

#include <memory>

#include "internal/db/api/status_repository.hpp"
#include "sqlite_db.hpp"

namespace inkvault::db::sqlite {

class SqliteStatusRepository final : public db::StatusRepository {
 public:
  // Creates the image_status table if missing.
  explicit SqliteStatusRepository(std::shared_ptr<SqliteDB> db);

  Result                             Upsert(const model::StatusRecord& record) override;
  std::optional<model::StatusRecord> Get(const std::string& image_name) override;
  std::vector<model::StatusRecord>   List() override;
  model::StatusCounts                Count() override;

 private:
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace inkvault::db::sqlite
