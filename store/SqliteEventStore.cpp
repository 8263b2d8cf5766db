#include "SqliteEventStore.h"
#include "../lib/Utilities.h"

namespace ppi {

namespace {

void bindText(sqlite3_stmt *st, int idx, const std::string &s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void bindU64(sqlite3_stmt *st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void bindI64(sqlite3_stmt *st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

const char *INSERT_EVENT_SQL =
    "INSERT INTO events(signature,instruction_index,event_index,slot,block_time,"
    "kind,origin,partial,fields_json,raw_hex,player_wallet,created_at) "
    "VALUES(?,?,?,?,?,?,?,?,?,?,?,?) "
    "ON CONFLICT(signature,instruction_index,event_index) DO NOTHING;";

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDb> spDb) : spDb_(std::move(spDb)) {}

SqliteTransaction::~SqliteTransaction() {
  if (active_ && !finished_) {
    auto result = spDb_->exec("ROLLBACK;");
    if (!result) {
      spDb_->log().error << "Rollback of abandoned transaction failed: "
                         << result.error().message;
    }
  }
}

Roe<void> SqliteTransaction::run(const std::string &sql) {
  auto result = spDb_->exec(sql);
  if (!result) {
    return toError(result.error());
  }
  return {};
}

Roe<void> SqliteTransaction::begin() {
  auto result = run("BEGIN IMMEDIATE;");
  if (result) {
    active_ = true;
  }
  return result;
}

Roe<void> SqliteTransaction::commit() {
  if (!active_ || finished_) {
    return Error(SqliteDb::E_INTERNAL, "Transaction is not active");
  }
  auto result = run("COMMIT;");
  if (result) {
    finished_ = true;
  }
  return result;
}

Roe<void> SqliteTransaction::rollback() {
  if (!active_ || finished_) {
    return Error(SqliteDb::E_INTERNAL, "Transaction is not active");
  }
  finished_ = true;
  return run("ROLLBACK;");
}

Roe<void> SqliteTransaction::savepoint(const std::string &name) {
  return run("SAVEPOINT \"" + name + "\";");
}

Roe<void> SqliteTransaction::release(const std::string &name) {
  return run("RELEASE SAVEPOINT \"" + name + "\";");
}

Roe<void> SqliteTransaction::rollbackTo(const std::string &name) {
  // ROLLBACK TO leaves the savepoint open, release it as well
  auto result = run("ROLLBACK TO SAVEPOINT \"" + name + "\";");
  if (!result) {
    return result;
  }
  return release(name);
}

SqliteEventStore::SqliteEventStore(std::shared_ptr<SqliteDb> spDb)
    : Module("store.events"), spDb_(std::move(spDb)) {}

Roe<std::unique_ptr<IEventStore::Transaction>> SqliteEventStore::begin() {
  auto spTx = std::make_unique<SqliteTransaction>(spDb_);
  auto result = spTx->begin();
  if (!result) {
    return result.error();
  }
  return std::unique_ptr<Transaction>(std::move(spTx));
}

Roe<IEventStore::StoreResult> SqliteEventStore::storeEvent(Transaction &tx,
                                                           const ParsedEvent &event) {
  auto &db = static_cast<SqliteTransaction &>(tx).getDb();

  auto roeStmt = db.prepare(INSERT_EVENT_SQL);
  if (!roeStmt) {
    return toError(roeStmt.error());
  }
  sqlite3_stmt *st = roeStmt.value().get();

  bindText(st, 1, event.signature);
  bindU64(st, 2, event.instructionIndex);
  bindU64(st, 3, event.eventIndex);
  bindU64(st, 4, event.slot);
  if (event.blockTime) {
    bindI64(st, 5, *event.blockTime);
  } else {
    sqlite3_bind_null(st, 5);
  }
  bindText(st, 6, getKindKey(event.kind));
  bindText(st, 7, event.origin == ParsedEvent::Origin::BINARY ? "binary" : "log_fallback");
  sqlite3_bind_int(st, 8, event.partial ? 1 : 0);
  bindText(st, 9, event.fieldsToJson().dump());
  bindText(st, 10, utl::hexEncode(event.raw));
  std::string wallet = event.getWallet();
  if (wallet.empty()) {
    sqlite3_bind_null(st, 11);
  } else {
    bindText(st, 11, wallet);
  }
  bindI64(st, 12, utl::getCurrentTime());

  int rc = sqlite3_step(st);
  if (rc != SQLITE_DONE) {
    return toError(db.translate(rc));
  }

  if (db.getChanges() == 0) {
    log().debug << "Duplicate " << getKindKey(event.kind) << " " << event.signature << "#"
                << event.instructionIndex << "." << event.eventIndex;
    return StoreResult::DUPLICATE;
  }
  return StoreResult::INSERTED;
}

Roe<uint64_t> SqliteEventStore::countEvents() {
  auto roeStmt = spDb_->prepare("SELECT COUNT(*) FROM events;");
  if (!roeStmt) {
    return toError(roeStmt.error());
  }
  sqlite3_stmt *st = roeStmt.value().get();
  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    return toError(spDb_->translate(rc));
  }
  return static_cast<uint64_t>(sqlite3_column_int64(st, 0));
}

Roe<bool> SqliteEventStore::hasEvent(const DedupKey &key) {
  auto roeStmt = spDb_->prepare(
      "SELECT 1 FROM events WHERE signature=? AND instruction_index=? AND event_index=?;");
  if (!roeStmt) {
    return toError(roeStmt.error());
  }
  sqlite3_stmt *st = roeStmt.value().get();
  bindText(st, 1, key.signature);
  bindU64(st, 2, key.instructionIndex);
  bindU64(st, 3, key.eventIndex);

  int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  return toError(spDb_->translate(rc));
}

} // namespace ppi
