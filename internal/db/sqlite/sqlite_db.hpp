#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <mutex>
#include <string>

namespace fleetq::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every lane in the process, so a transaction
  holds WriterMutex() for its whole lifetime. Other processes are kept out
  by BEGIN IMMEDIATE plus the busy timeout.
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

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Execute a SQL string (pragmas, migrations, BEGIN/COMMIT).
  // SQLITE_BUSY / SQLITE_LOCKED raise util::TransactionConflict.
  void Exec(const std::string& sql);

  // Configure PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

/*
  Prepared statement, finalized on scope exit.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* Get() const {
    return stmt_;
  }

  // Empty string binds NULL.
  void BindText(int idx, const std::string& value);
  void BindInt64(int idx, int64_t value);
  // Zero binds NULL.
  void BindMillis(int idx, int64_t value);
  void BindNull(int idx);
  void BindDouble(int idx, double value);

  int Step();

 private:
  sqlite3*      db_   = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace fleetq::db::sqlite
