#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace keyshop::db::sql {

/*
  Parameter abstraction.

  Canonical SQL uses $1 $2 $3 in both engines:
    Postgres binds them positionally
    SQLite   binds them by name ("$1" is a valid SQLite parameter name)
*/

using Param = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

using Params = std::vector<Param>;

inline Param OptionalParam(const std::optional<int64_t>& v) {
  if (v) return *v;
  return nullptr;
}

}
