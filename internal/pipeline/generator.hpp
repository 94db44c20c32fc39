#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/store.hpp"
#include "internal/graph/metrics_engine.hpp"
#include "internal/source/source_catalog.hpp"

namespace cpandb::pipeline {

struct GeneratorOptions {
  std::filesystem::path     output;
  db::sqlite::SqliteOptions store;

  // rows per commit in every keyed backfill pass
  uint32_t batch_size = 100;

  graph::MetricsOptions metrics;

  bool keep_intermediate = false;
  bool vacuum            = true;
  bool analyze           = true;
};

struct RunSummary {
  int64_t authors       = 0;
  int64_t distributions = 0;
  int64_t modules       = 0;
  int64_t dependencies  = 0;
  int64_t requires_rows = 0;
  int64_t tickets       = 0;

  int64_t with_uploaded = 0;
  int64_t with_meta     = 0;
  int64_t with_rating   = 0;
};

/*
  Generator

  Runs one full rebuild of the index:

    prepare    clear the output file, open the store
    attach     report source ages, attach the extracts
    normalize  t_* intermediate tables
    clean      repair versions in t_requires
    merge      author, distribution, module, ticket + backfills
    resolve    dependency, requires
    metrics    weight, volatility
    finalize   remaining indexes, coverage, drop t_*, detach, VACUUM, ANALYZE

  Any failure aborts the run with util::StageFailure naming the stage.
*/
class Generator {
 public:
  Generator(GeneratorOptions options, source::SourceCatalog catalog);

  RunSummary Run();

 private:
  template <typename Fn>
  void RunStage(const char* name, Fn&& fn);

  void PrepareOutput();
  void Finalize(db::Store& store, RunSummary& summary);

  GeneratorOptions     options_;
  source::SourceCatalog catalog_;
};

} // namespace cpandb::pipeline
