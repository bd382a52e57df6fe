#pragma once

#include <sqlite3.h>

#include <string>

namespace inkvault::db::sqlite {

/*
  RAII owner of one sqlite3 connection.

  Opened in serialized (FULLMUTEX) mode so a single handle can be shared by
  the executors of every open session. Errors surface as util::IOError.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // pragmas and schema
  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Finalizes a prepared statement on scope exit.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }
  bool ok() const {
    return stmt_ != nullptr;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace inkvault::db::sqlite
