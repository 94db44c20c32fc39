#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sqlite/sqlite_stmt.hpp"
#include "internal/db/store.hpp"

namespace cpandb::db {

/*
  Keyed update pass committed in fixed-size batches.

  One transaction is open per batch of batch_size rows. Destroying the
  updater without Finish() rolls back only the batch in flight; every
  earlier batch is already committed.
*/
class BatchedUpdater {
 public:
  struct Stats {
    uint64_t applied   = 0;
    uint64_t unmatched = 0;
    uint64_t commits   = 0;
  };

  BatchedUpdater(Store& store, const std::string& sql, uint32_t batch_size);

  BatchedUpdater(const BatchedUpdater&)            = delete;
  BatchedUpdater& operator=(const BatchedUpdater&) = delete;

  // Runs the statement for one row. NotFound when it matched no row;
  // statement failures throw.
  Result Apply(const sql::Params& params);

  // Commits the trailing partial batch.
  void Finish();

  const Stats& stats() const {
    return stats_;
  }

 private:
  void CommitBatch();

  Store&                       store_;
  sqlite::Statement            stmt_;
  uint32_t                     batch_size_;
  uint32_t                     pending_ = 0;
  std::unique_ptr<Transaction> tx_;
  Stats                        stats_;
};

} // namespace cpandb::db
