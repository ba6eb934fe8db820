#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace offline::db::sqlite {

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw offline::util::StorageError("open " + path_ + ": " + msg);
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
    ThrowIfError(Result::Err(Translate(rc).code, msg), "sqlite exec");
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIfError(Translate(rc), "sqlite prepare");
  return Statement(stmt);
}

Result SqliteDB::Translate(int rc) const {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db_));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db_));
    case SQLITE_FULL:
      return Result::Err(ErrorCode::QuotaExceeded, sqlite3_errmsg(db_));
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db_));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db_));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db_));
  }
}

void SqliteDB::Configure() {
  // readers are not blocked by a writer
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIfError(Translate(sqlite3_busy_timeout(db_, 5000)), "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace offline::db::sqlite
