#pragma once

#include <cstdint>

#include "internal/db/store.hpp"
#include "internal/source/source_catalog.hpp"

namespace cpandb::pipeline {

/*
  Projects each attached extract into an intermediate t_* table keyed
  the way the final schema is keyed:

    t_distribution  one row per distribution name, latest release wins
    t_testers       summed test counts per "dist version"
    t_uploaded      one upload date per release path, shortest dist name wins
    t_ticket        open tickets of known distributions, one row per id
    t_requires      module-level dependency declarations per distribution

  An absent optional extract produces an empty table with the same
  columns, so later left joins see nulls instead of failing.
*/
class Normalizer {
 public:
  struct Stats {
    int64_t distributions = 0;
    int64_t testers       = 0;
    int64_t uploads       = 0;
    int64_t tickets       = 0;
    int64_t requires_rows = 0;
  };

  Normalizer(db::Store& store, const source::SourceCatalog& catalog);

  Stats Run();

  void BuildDistributions();
  void BuildTesters();
  void BuildUploads();
  void BuildTickets();
  void BuildRequires();

 private:
  // true when alias is attached and holds table; logs otherwise
  bool HasSourceTable(const char* alias, const char* table) const;

  db::Store&                   store_;
  const source::SourceCatalog& catalog_;
};

} // namespace cpandb::pipeline
