#pragma once

#include <cstdint>

#include "internal/db/store.hpp"
#include "internal/source/source_catalog.hpp"

namespace cpandb::pipeline {

/*
  Builds the entity tables from the normalized t_* tables.

  distribution is a left join of the package index with uploads and
  testers, so a release with no secondary data still gets its row.
  Ratings and META data use other keys (name, release path) and are
  applied afterwards as keyed, batched updates; a key that matches no
  distribution is counted, never fatal.
*/
class EntityMerger {
 public:
  struct Stats {
    int64_t  authors             = 0;
    int64_t  distributions       = 0;
    int64_t  modules             = 0;
    int64_t  tickets             = 0;
    uint64_t ratings_applied     = 0;
    uint64_t ratings_unmatched   = 0;
    uint64_t meta_applied        = 0;
    uint64_t meta_unmatched      = 0;
  };

  EntityMerger(db::Store& store, const source::SourceCatalog& catalog, uint32_t batch_size);

  Stats Run();

  void BuildAuthors();
  void BuildDistributions();
  void BackfillRatings();
  void BackfillMeta();
  void BuildModules();
  void BuildTickets();

 private:
  db::Store&                   store_;
  const source::SourceCatalog& catalog_;
  uint32_t                     batch_size_;
  Stats                        stats_;
};

} // namespace cpandb::pipeline
