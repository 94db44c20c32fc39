#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cpandb::db::sql {

/*
  Current result row of a query, valid only inside the row callback.

  Extract columns are loosely typed (a count may arrive as text, a
  version as a number); the getters convert the way sqlite does.
*/
class Row {
public:
  virtual ~Row() = default;

  virtual std::string GetText(int col) const = 0;
  virtual int64_t GetInt64(int col) const = 0;
  virtual double GetDouble(int col) const = 0;
  virtual bool IsNull(int col) const = 0;

  std::optional<std::string> GetOptionalText(int col) const {
    if (IsNull(col)) return std::nullopt;
    return GetText(col);
  }

  std::optional<int64_t> GetOptionalInt64(int col) const {
    if (IsNull(col)) return std::nullopt;
    return GetInt64(col);
  }
};

}
