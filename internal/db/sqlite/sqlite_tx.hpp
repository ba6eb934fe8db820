#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace offline::db::sqlite {

/*
  SQLite transaction guard.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  Rolls back on destruction unless committed.
*/
class SqliteTransaction {
public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&) = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit();

private:
  SqliteDB& db_;
  bool committed_ = false;
};

}
