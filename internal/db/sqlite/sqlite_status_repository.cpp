#include "sqlite_status_repository.hpp"

#include "internal/observability/logging.hpp"

namespace inkvault::db::sqlite {

using inkvault::observability::ErrorField;

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS image_status ("
    "  image_name      TEXT PRIMARY KEY,"
    "  done            INTEGER NOT NULL DEFAULT 0,"
    "  ink_found       INTEGER NOT NULL DEFAULT 0,"
    "  last_updated_ms INTEGER NOT NULL DEFAULT 0"
    ");";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

model::StatusRecord ReadRow(sqlite3_stmt* st) {
  model::StatusRecord r;
  r.image_name      = ColText(st, 0);
  r.done            = sqlite3_column_int(st, 1) != 0;
  r.ink_found       = sqlite3_column_int(st, 2) != 0;
  r.last_updated_ms = sqlite3_column_int64(st, 3);
  return r;
}

} // namespace

SqliteStatusRepository::SqliteStatusRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec(kSchema);
}

Result SqliteStatusRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteStatusRepository::Upsert(const model::StatusRecord& r) {
  auto* db = db_->Handle();

  const char* sql =
      "INSERT INTO image_status(image_name,done,ink_found,last_updated_ms) VALUES(?,?,?,?) "
      "ON CONFLICT(image_name) DO UPDATE SET done=excluded.done, ink_found=excluded.ink_found, "
      "last_updated_ms=excluded.last_updated_ms;";

  Statement st(db, sql);
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.image_name);
  sqlite3_bind_int(st.get(), 2, r.done ? 1 : 0);
  sqlite3_bind_int(st.get(), 3, r.ink_found ? 1 : 0);
  sqlite3_bind_int64(st.get(), 4, static_cast<sqlite3_int64>(r.last_updated_ms));

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::StatusRecord> SqliteStatusRepository::Get(const std::string& image_name) {
  auto* db = db_->Handle();

  Statement st(db, "SELECT image_name,done,ink_found,last_updated_ms FROM image_status WHERE image_name=?;");
  if (!st.ok()) {
    INKVAULT_LOG_ERROR("status lookup prepare failed", {ErrorField(sqlite3_errmsg(db))});
    return std::nullopt;
  }

  BindText(st.get(), 1, image_name);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  return ReadRow(st.get());
}

std::vector<model::StatusRecord> SqliteStatusRepository::List() {
  auto* db = db_->Handle();

  std::vector<model::StatusRecord> out;
  Statement st(db, "SELECT image_name,done,ink_found,last_updated_ms FROM image_status ORDER BY image_name;");
  if (!st.ok()) {
    INKVAULT_LOG_ERROR("status list prepare failed", {ErrorField(sqlite3_errmsg(db))});
    return out;
  }

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadRow(st.get()));
  }
  return out;
}

model::StatusCounts SqliteStatusRepository::Count() {
  auto* db = db_->Handle();

  model::StatusCounts counts;
  Statement st(db, "SELECT COUNT(*), COALESCE(SUM(done),0), COALESCE(SUM(ink_found),0) FROM image_status;");
  if (!st.ok()) {
    INKVAULT_LOG_ERROR("status count prepare failed", {ErrorField(sqlite3_errmsg(db))});
    return counts;
  }

  if (sqlite3_step(st.get()) == SQLITE_ROW) {
    counts.total     = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
    counts.done      = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 1));
    counts.ink_found = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 2));
  }
  return counts;
}

} // namespace inkvault::db::sqlite
