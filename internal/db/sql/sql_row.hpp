#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace keyshop::db::sql {

/*
  Generic row reader.

  Backends wrap their result row:
    postgres -> pqxx::row
    sqlite   -> sqlite3_stmt

  Prevents driver types leaking into repository logic.
*/

class Row {
public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const = 0;
  virtual int64_t GetInt64(int col) const = 0;
  virtual double GetDouble(int col) const = 0;
  virtual bool IsNull(int col) const = 0;

  std::optional<int64_t> GetOptionalInt64(int col) const {
    if (IsNull(col)) return std::nullopt;
    return GetInt64(col);
  }

  bool GetBool(int col) const {
    return GetInt64(col) != 0;
  }
};

}
