#include "sqlite_tx.hpp"

#include <string>
#include <type_traits>

#include "internal/observability/logging.hpp"

namespace keyshop::db::sqlite {

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

class SqliteRow final : public sql::Row {
public:
  explicit SqliteRow(sqlite3_stmt* st) : st_(st) {}

  std::string GetText(int col) const override {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }

  int64_t GetInt64(int col) const override {
    return sqlite3_column_int64(st_, col);
  }

  double GetDouble(int col) const override {
    return sqlite3_column_double(st_, col);
  }

  bool IsNull(int col) const override {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
  }

private:
  sqlite3_stmt* st_;
};

[[noreturn]] void Fail(sqlite3* db, int rc, std::string_view sql) {
  throw DatabaseError(SqliteDB::Translate(rc), std::string(sqlite3_errmsg(db)) + " [" + std::string(sql) + "]");
}

Statement Prepare(sqlite3* db, std::string_view sql, const sql::Params& params) {
  sqlite3_stmt* raw = nullptr;
  int rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
  if (rc != SQLITE_OK) Fail(db, rc, sql);
  Statement st(raw);

  // $n placeholders are named parameters in sqlite; unused ones are skipped
  for (std::size_t i = 0; i < params.size(); ++i) {
    const std::string name = "$" + std::to_string(i + 1);
    const int idx = sqlite3_bind_parameter_index(st.get(), name.c_str());
    if (idx == 0) continue;

    rc = std::visit(
        [&](const auto& v) -> int {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(st.get(), idx);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(st.get(), idx, static_cast<sqlite3_int64>(v));
          } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(st.get(), idx, v);
          } else {
            return sqlite3_bind_text(st.get(), idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
          }
        },
        params[i]);
    if (rc != SQLITE_OK) Fail(db, rc, sql);
  }
  return st;
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      KEYSHOP_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

int64_t SqliteTransaction::Execute(std::string_view sql, const sql::Params& params) {
  auto* db = Handle();
  auto st = Prepare(db, sql, params);

  int rc = SQLITE_ROW;
  while (rc == SQLITE_ROW) {
    rc = sqlite3_step(st.get());
  }
  if (rc != SQLITE_DONE) Fail(db, rc, sql);

  return sqlite3_changes(db);
}

void SqliteTransaction::Query(std::string_view sql, const sql::Params& params, const RowCallback& on_row) {
  auto* db = Handle();
  auto st = Prepare(db, sql, params);

  SqliteRow row(st.get());
  for (;;) {
    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) Fail(db, rc, sql);
    on_row(row);
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

}
