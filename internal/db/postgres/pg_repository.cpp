#include "pg_repository.hpp"

#include "internal/db/sql/migrations.hpp"

namespace keyshop::db::postgres {

namespace {

class PgMigrationExecutor final : public sql::MigrationExecutor {
public:
  explicit PgMigrationExecutor(PgTransaction& tx) : tx_(tx) {}

  void ExecuteSQL(const std::string& sql) override {
    tx_.Execute(sql, {});
  }

private:
  PgTransaction& tx_;
};

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

void PgRepository::Bootstrap() {
  PgTransaction tx(pool_);
  PgMigrationExecutor executor(tx);
  sql::RunMigrations(executor, sql::PostgresSchema());
  tx.Commit();
}

} // namespace keyshop::db::postgres
