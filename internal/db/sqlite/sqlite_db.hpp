#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/result.hpp"

namespace offline::db::sqlite {

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the cache and sync stores. Multi-statement
  operations must hold Lock() for their whole duration so that transactions
  of different callers never interleave on the connection.
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

  std::unique_lock<std::recursive_mutex> Lock() {
    return std::unique_lock<std::recursive_mutex>(mutex_);
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Map a sqlite return code to the portable result
  Result Translate(int rc) const;

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*             db_ = nullptr;
  std::string          path_;
  std::recursive_mutex mutex_;
};

} // namespace offline::db::sqlite
