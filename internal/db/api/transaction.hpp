#pragma once

namespace cpandb::db {

/*
  One write transaction on the index store.

  A transaction that is still open when destroyed is rolled back. The
  batched updater keeps one open per batch, so an abort loses only the
  batch in flight.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  // Throws util::StoreError when the transaction is already closed.
  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  virtual bool IsOpen() const = 0;
};

}
