#ifndef PP_INDEXER_SQLITE_CHECKPOINT_STORE_H
#define PP_INDEXER_SQLITE_CHECKPOINT_STORE_H

#include "SqliteDb.h"
#include "../interface/ICheckpointStore.hpp"
#include "../lib/Module.h"

#include <memory>

namespace ppi {

/**
 * Single-row checkpoint table. advance() is an upsert that only writes when
 * the new slot is strictly greater, so concurrent or replayed callers can
 * never move it backwards.
 */
class SqliteCheckpointStore : public ICheckpointStore, public Module {
public:
  explicit SqliteCheckpointStore(std::shared_ptr<SqliteDb> spDb);
  ~SqliteCheckpointStore() override = default;

  Roe<std::optional<Checkpoint>> load() override;
  Roe<bool> advance(uint64_t slot) override;

private:
  std::shared_ptr<SqliteDb> spDb_;
};

} // namespace ppi

#endif // PP_INDEXER_SQLITE_CHECKPOINT_STORE_H
