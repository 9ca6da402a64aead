#pragma once

#include <cstdint>
#include <functional>
#include <string_view>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace keyshop::db::sql {

/*
  Transaction that can run canonical SQL.

  Implemented by the sqlite and postgres backends so that one
  SqlRepository serves both. Driver errors are thrown as DatabaseError.
*/
class SqlTransaction : public db::Transaction {
public:
  using RowCallback = std::function<void(const Row&)>;

  // Runs a statement and returns the number of affected rows.
  virtual int64_t Execute(std::string_view sql, const Params& params) = 0;

  // Runs a statement and feeds every result row to on_row.
  virtual void Query(std::string_view sql, const Params& params, const RowCallback& on_row) = 0;
};

}
