#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/sql/sql_transaction.hpp"
#include "pg_pool.hpp"

namespace keyshop::db::postgres {

/*
  pqxx::work on a pooled connection.

  Runs at READ COMMITTED; correctness comes from the conditional writes in
  the canonical SQL (UPDATE ... WHERE status='pending', ON CONFLICT DO
  NOTHING), which Postgres re-evaluates against the latest row version.
*/
class PgTransaction final : public sql::SqlTransaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction() override;

  pqxx::work& Work() { return *tx_; }

  int64_t Execute(std::string_view sql, const sql::Params& params) override;
  void Query(std::string_view sql, const sql::Params& params, const RowCallback& on_row) override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  pqxx::result Run(std::string_view sql, const sql::Params& params);

  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work> tx_;
  bool committed_ = false;
  bool finished_ = false;
};

// Maps a libpqxx exception to the portable error and throws it.
[[noreturn]] void Rethrow(const std::exception& e);

}
