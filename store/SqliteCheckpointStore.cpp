#include "SqliteCheckpointStore.h"
#include "SqliteEventStore.h"
#include "../lib/Utilities.h"

namespace ppi {

SqliteCheckpointStore::SqliteCheckpointStore(std::shared_ptr<SqliteDb> spDb)
    : Module("store.checkpoint"), spDb_(std::move(spDb)) {}

Roe<std::optional<Checkpoint>> SqliteCheckpointStore::load() {
  auto roeStmt =
      spDb_->prepare("SELECT last_processed_slot, updated_at FROM checkpoint WHERE id=1;");
  if (!roeStmt) {
    return toError(roeStmt.error());
  }
  sqlite3_stmt *st = roeStmt.value().get();

  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    return std::optional<Checkpoint>();
  }
  if (rc != SQLITE_ROW) {
    return toError(spDb_->translate(rc));
  }

  Checkpoint cp;
  cp.lastProcessedSlot = static_cast<uint64_t>(sqlite3_column_int64(st, 0));
  cp.updatedAt = sqlite3_column_int64(st, 1);
  return std::optional<Checkpoint>(cp);
}

Roe<bool> SqliteCheckpointStore::advance(uint64_t slot) {
  auto roeStmt = spDb_->prepare(
      "INSERT INTO checkpoint(id,last_processed_slot,updated_at) VALUES(1,?,?) "
      "ON CONFLICT(id) DO UPDATE SET "
      "last_processed_slot=excluded.last_processed_slot, updated_at=excluded.updated_at "
      "WHERE excluded.last_processed_slot > checkpoint.last_processed_slot;");
  if (!roeStmt) {
    return toError(roeStmt.error());
  }
  sqlite3_stmt *st = roeStmt.value().get();
  sqlite3_bind_int64(st, 1, static_cast<sqlite3_int64>(slot));
  sqlite3_bind_int64(st, 2, static_cast<sqlite3_int64>(utl::getCurrentTime()));

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) {
    return toError(spDb_->translate(rc));
  }

  bool advanced = spDb_->getChanges() > 0;
  if (advanced) {
    log().debug << "Checkpoint advanced to " << slot;
  }
  return advanced;
}

} // namespace ppi
