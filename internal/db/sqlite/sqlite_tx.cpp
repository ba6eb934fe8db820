#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace offline::db::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_.Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      OFFLINE_LOG_WARN("sqlite rollback failed", {offline::observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  committed_ = true;
}

} // namespace offline::db::sqlite
