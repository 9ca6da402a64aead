#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/sql/migrations.hpp"

namespace keyshop::db::sqlite {

struct SqliteOptions {
  bool wal_mode        = true;
  int  busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the whole process; TransactionMutex()
  serializes transactions on it (see SqliteTransaction).
*/
class SqliteDB : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Maps an sqlite result code to the portable code.
  static ErrorCode Translate(int rc);

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace keyshop::db::sqlite
