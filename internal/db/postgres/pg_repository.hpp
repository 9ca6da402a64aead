#pragma once

#include <memory>

#include "internal/db/sql/sql_repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace keyshop::db::postgres {

class PgRepository final : public sql::SqlRepository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  // Creates any missing tables and indices in one transaction.
  void Bootstrap();

private:
  std::shared_ptr<PgPool> pool_;
};

}
