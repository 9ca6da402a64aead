#include "pg_tx.hpp"

#include <string>
#include <variant>
#include <type_traits>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace keyshop::db::postgres {

namespace {

class PgRow final : public sql::Row {
public:
  explicit PgRow(const pqxx::row& row) : row_(row) {}

  std::string GetText(int col) const override {
    return row_[col].is_null() ? std::string() : row_[col].c_str();
  }

  int64_t GetInt64(int col) const override {
    return row_[col].as<int64_t>();
  }

  double GetDouble(int col) const override {
    return row_[col].as<double>();
  }

  bool IsNull(int col) const override {
    return row_[col].is_null();
  }

private:
  const pqxx::row& row_;
};

pqxx::params ToPqxx(const sql::Params& params) {
  pqxx::params out;
  for (const auto& p : params) {
    std::visit(
        [&](const auto& v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else {
            out.append(v);
          }
        },
        p);
  }
  return out;
}

} // namespace

void Rethrow(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    throw DatabaseError(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    throw DatabaseError(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    throw DatabaseError(ErrorCode::IOError, e.what());
  }
  if (auto* db_error = dynamic_cast<const DatabaseError*>(&e)) {
    throw *db_error;
  }
  throw DatabaseError(ErrorCode::InternalError, e.what());
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  try {
    conn_ = pool->Acquire();
    tx_ = std::make_unique<pqxx::work>(*conn_);
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_ && tx_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      KEYSHOP_LOG_ERROR("postgres abort failed", {observability::StringField("error", e.what())});
    }
  }
}

pqxx::result PgTransaction::Run(std::string_view sql, const sql::Params& params) {
  try {
    return tx_->exec_params(pqxx::zview(sql.data(), sql.size()), ToPqxx(params));
  } catch (const std::exception& e) {
    Rethrow(e);
  }
}

int64_t PgTransaction::Execute(std::string_view sql, const sql::Params& params) {
  return static_cast<int64_t>(Run(sql, params).affected_rows());
}

void PgTransaction::Query(std::string_view sql, const sql::Params& params, const RowCallback& on_row) {
  const auto result = Run(sql, params);
  for (const auto& row : result) {
    PgRow wrapped(row);
    on_row(wrapped);
  }
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    finished_ = true;
    Rethrow(e);
  }
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  tx_->abort();
}

}
