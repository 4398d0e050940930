#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace eventship::db::sqlite {

/*
  Owning handle for a sqlite3 connection.

  Errors surface as std::runtime_error carrying sqlite's message.
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

  const std::string& path() const {
    return path_;
  }

  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

/*
  Prepared statement finalized on scope exit. Bind indexes are 1-based.
*/
class Statement {
 public:
  Statement(SqliteDB& db, std::string_view sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  void BindText(int index, std::string_view value);
  void BindInt64(int index, std::int64_t value);

  // True while a row is available; false once the statement is done.
  bool Step();

  std::int64_t ColumnInt64(int column) const;
  std::string  ColumnText(int column) const;

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace eventship::db::sqlite
