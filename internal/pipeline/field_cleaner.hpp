#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/store.hpp"

namespace cpandb::pipeline {

/*
  Repairs version and core values in t_requires.

  Values that start with a comparator (">= 1.2", "<2") or a v ("v5.10.1")
  are rewritten to their bare version token; afterwards no version or
  core is null-or-empty where a number is expected:

    version NULL                -> '0'
    version ''                  -> '0', core 0
    core ''                     -> 0

  Rewriting is idempotent, so running the pass twice changes nothing the
  second time.
*/
class FieldCleaner {
 public:
  struct Stats {
    int64_t versions_rewritten  = 0;
    int64_t cores_rewritten     = 0;
    int64_t versions_defaulted  = 0;
    int64_t cores_defaulted     = 0;
  };

  explicit FieldCleaner(db::Store& store);

  // Keeps digits, '.' and '_' only. Null stays null.
  static std::optional<std::string> CleanVersion(const std::optional<std::string>& value);

  // true when the value starts with a comparator or 'v'/'V'
  static bool NeedsCleaning(const std::string& value);

  Stats Run();

 private:
  int64_t RewriteColumn(const char* select_sql, const char* update_sql);

  db::Store& store_;
};

} // namespace cpandb::pipeline
