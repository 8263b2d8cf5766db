#include "SqliteDb.h"

namespace ppi {

namespace {

const char *SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS events (
  id                INTEGER PRIMARY KEY AUTOINCREMENT,
  signature         TEXT    NOT NULL,
  instruction_index INTEGER NOT NULL,
  event_index       INTEGER NOT NULL,
  slot              INTEGER NOT NULL,
  block_time        INTEGER,
  kind              TEXT    NOT NULL,
  origin            TEXT    NOT NULL,
  partial           INTEGER NOT NULL DEFAULT 0,
  fields_json       TEXT    NOT NULL,
  raw_hex           TEXT    NOT NULL,
  player_wallet     TEXT,
  created_at        INTEGER NOT NULL,
  UNIQUE (signature, instruction_index, event_index)
);
CREATE INDEX IF NOT EXISTS idx_events_slot ON events(slot);
CREATE INDEX IF NOT EXISTS idx_events_kind ON events(kind);
CREATE INDEX IF NOT EXISTS idx_events_player ON events(player_wallet);
CREATE TABLE IF NOT EXISTS checkpoint (
  id                  INTEGER PRIMARY KEY CHECK (id = 1),
  last_processed_slot INTEGER NOT NULL,
  updated_at          INTEGER NOT NULL
);
)SQL";

} // namespace

SqliteDb::SqliteDb() : Module("store.db") {}

SqliteDb::~SqliteDb() { close(); }

SqliteDb::Roe<void> SqliteDb::open(const std::string &path) {
  if (db_ != nullptr) {
    return Error(E_OPEN, "Database already open: " + path_);
  }

  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return Error(E_OPEN, "Failed to open " + path + ": " + msg);
  }
  path_ = path;

  auto result = configure();
  if (!result) {
    close();
    return result.error();
  }

  log().info << "Opened database " << path_;
  return {};
}

void SqliteDb::close() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteDb::Roe<void> SqliteDb::exec(const std::string &sql) {
  if (db_ == nullptr) {
    return Error(E_INTERNAL, "Database not open");
  }
  char *err = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    Error error = translate(rc);
    if (err != nullptr) {
      error.message = err;
      sqlite3_free(err);
    }
    return error;
  }
  return {};
}

SqliteDb::Roe<SqliteDb::Statement> SqliteDb::prepare(const std::string &sql) {
  if (db_ == nullptr) {
    return Error(E_INTERNAL, "Database not open");
  }
  sqlite3_stmt *stmt = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK) {
    return translate(rc);
  }
  return Statement(stmt);
}

SqliteDb::Roe<void> SqliteDb::configure() {
  auto result = exec("PRAGMA journal_mode=WAL;");
  if (!result) {
    return result;
  }
  result = exec("PRAGMA synchronous=NORMAL;");
  if (!result) {
    return result;
  }
  int rc = sqlite3_busy_timeout(db_, 5000);
  if (rc != SQLITE_OK) {
    return translate(rc);
  }
  result = exec("PRAGMA temp_store=MEMORY;");
  if (!result) {
    return result;
  }
  return createSchema();
}

SqliteDb::Roe<void> SqliteDb::createSchema() {
  auto result = exec(SCHEMA_SQL);
  if (!result) {
    return Error(result.error().code, "Failed to create schema: " + result.error().message);
  }
  return {};
}

int SqliteDb::getChanges() const { return db_ ? sqlite3_changes(db_) : 0; }

SqliteDb::Error SqliteDb::translate(int rc) const {
  std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
  switch (rc & 0xff) {
  case SQLITE_BUSY:
  case SQLITE_LOCKED:
    return Error(E_BUSY, msg);
  case SQLITE_CONSTRAINT:
    return Error(E_CONSTRAINT, msg);
  case SQLITE_IOERR:
    return Error(E_IO, msg);
  default:
    return Error(E_INTERNAL, msg);
  }
}

} // namespace ppi
