#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace fleetq::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc == SQLITE_OK) return;

  const std::string msg = what + ": " + sqlite3_errmsg(db);
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::TransactionConflict(msg);
  }
  throw std::runtime_error(msg);
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
      throw util::TransactionConflict(msg);
    }
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure() {
  // WAL lets other processes read while a worker holds the write lock
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

// ---------------------------------------------------------------------------
// Statement
// ---------------------------------------------------------------------------

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  ThrowIf(sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), db_, "sqlite prepare");
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& value) {
  if (value.empty()) {
    BindNull(idx);
    return;
  }
  ThrowIf(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT), db_, "sqlite bind");
}

void Statement::BindInt64(int idx, int64_t value) {
  ThrowIf(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)), db_, "sqlite bind");
}

void Statement::BindMillis(int idx, int64_t value) {
  if (value == 0) {
    BindNull(idx);
    return;
  }
  BindInt64(idx, value);
}

void Statement::BindNull(int idx) {
  ThrowIf(sqlite3_bind_null(stmt_, idx), db_, "sqlite bind");
}

void Statement::BindDouble(int idx, double value) {
  ThrowIf(sqlite3_bind_double(stmt_, idx, value), db_, "sqlite bind");
}

int Statement::Step() {
  return sqlite3_step(stmt_);
}

} // namespace fleetq::db::sqlite
