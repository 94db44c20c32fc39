#include "batch_updater.hpp"

#include "internal/util/errors.hpp"

namespace cpandb::db {

BatchedUpdater::BatchedUpdater(Store& store, const std::string& sql, uint32_t batch_size)
    : store_(store), stmt_(store.Prepare(sql)), batch_size_(batch_size) {
  if (batch_size_ == 0) {
    throw util::StoreError("batch size must be positive", sql);
  }
}

Result BatchedUpdater::Apply(const sql::Params& params) {
  if (!tx_) {
    tx_ = store_.Begin();
  }

  stmt_.Bind(params);
  while (stmt_.Step()) {
  }

  const auto changed = store_.Changes();
  Result     result  = changed == 0 ? Result::NotFound("no row matched") : Result::Ok(changed);
  if (result) {
    ++stats_.applied;
  } else {
    ++stats_.unmatched;
  }

  if (++pending_ >= batch_size_) {
    CommitBatch();
  }
  return result;
}

void BatchedUpdater::Finish() {
  if (tx_) {
    CommitBatch();
  }
}

void BatchedUpdater::CommitBatch() {
  tx_->Commit();
  tx_.reset();
  pending_ = 0;
  ++stats_.commits;
}

} // namespace cpandb::db
