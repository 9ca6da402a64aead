#pragma once

#include <memory>
#include <mutex>

#include "internal/db/sql/sql_transaction.hpp"
#include "sqlite_db.hpp"

namespace keyshop::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - the read-then-conditional-write of a caller can never interleave
      with another writer

  The connection is shared, so the transaction also holds the
  connection's transaction mutex for its whole lifetime.
*/
class SqliteTransaction final : public sql::SqlTransaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  int64_t Execute(std::string_view sql, const sql::Params& params) override;
  void Query(std::string_view sql, const sql::Params& params, const RowCallback& on_row) override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
  bool finished_ = false;
};

}
