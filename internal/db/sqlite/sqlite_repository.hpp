#pragma once

#include <memory>

#include "internal/db/sql/sql_repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace keyshop::db::sqlite {

class SqliteRepository final : public sql::SqlRepository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  // Creates any missing tables and indices.
  void Bootstrap();

private:
  std::shared_ptr<SqliteDB> db_;
};

}
