#ifndef PP_INDEXER_SQLITE_EVENT_STORE_H
#define PP_INDEXER_SQLITE_EVENT_STORE_H

#include "SqliteDb.h"
#include "../interface/IEventStore.hpp"
#include "../lib/Module.h"

#include <memory>
#include <string>

namespace ppi {

/**
 * Transaction on a SqliteDb, opened with BEGIN IMMEDIATE so the write lock
 * is taken up front. Rolled back on destruction unless committed.
 */
class SqliteTransaction : public IEventStore::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDb> spDb);
  ~SqliteTransaction() override;

  /** Issue BEGIN IMMEDIATE. Must succeed before the transaction is used. */
  Roe<void> begin();

  Roe<void> commit() override;
  Roe<void> rollback() override;

  Roe<void> savepoint(const std::string &name) override;
  Roe<void> release(const std::string &name) override;
  Roe<void> rollbackTo(const std::string &name) override;

  bool isFinished() const { return finished_; }
  SqliteDb &getDb() const { return *spDb_; }

private:
  Roe<void> run(const std::string &sql);

  std::shared_ptr<SqliteDb> spDb_;
  bool active_{ false };
  bool finished_{ false };
};

class SqliteEventStore : public IEventStore, public Module {
public:
  explicit SqliteEventStore(std::shared_ptr<SqliteDb> spDb);
  ~SqliteEventStore() override = default;

  Roe<std::unique_ptr<Transaction>> begin() override;
  Roe<StoreResult> storeEvent(Transaction &tx, const ParsedEvent &event) override;

  Roe<uint64_t> countEvents() override;
  Roe<bool> hasEvent(const DedupKey &key) override;

private:
  std::shared_ptr<SqliteDb> spDb_;
};

/** Convert a SqliteDb error to the collaborator interface error */
inline Error toError(const SqliteDb::Error &error) {
  return Error(error.code, error.message);
}

} // namespace ppi

#endif // PP_INDEXER_SQLITE_EVENT_STORE_H
