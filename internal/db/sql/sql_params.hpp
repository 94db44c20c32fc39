#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cpandb::db::sql {

/*
  A value bound to one ? placeholder. Statement text never carries
  values; only code-owned identifiers are spliced in.

  Pass int32_t or int64_t explicitly: an unsigned 32-bit value would be
  ambiguous between the integer alternatives.
*/
using Param = std::variant<
    std::nullptr_t,
    int32_t,
    int64_t,
    uint64_t,
    double,
    std::string
>;

using Params = std::vector<Param>;

// NULL for a missing value.
inline Param OptionalText(const std::optional<std::string>& value) {
  if (!value) return nullptr;
  return *value;
}

}
