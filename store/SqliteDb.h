#ifndef PP_INDEXER_SQLITE_DB_H
#define PP_INDEXER_SQLITE_DB_H

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <sqlite3.h>

#include <memory>
#include <string>

namespace ppi {

/**
 * RAII owner of one SQLite connection.
 *
 * The connection is opened in serialized mode so the status reader and the
 * ingestion thread may share it. SQLite result codes are reported as Error
 * codes, the wrapper never throws.
 */
class SqliteDb : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Lock contention, worth retrying
  static constexpr const int32_t E_BUSY = -1;
  static constexpr const int32_t E_CONSTRAINT = -2;
  static constexpr const int32_t E_IO = -3;
  static constexpr const int32_t E_INTERNAL = -4;
  static constexpr const int32_t E_OPEN = -5;

  struct StatementDeleter {
    void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
  };
  using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

  SqliteDb();
  ~SqliteDb() override;

  /**
   * Open (creating if needed) the database file and configure it.
   * ":memory:" opens a private in-memory database.
   */
  Roe<void> open(const std::string &path);
  void close();

  bool isOpen() const { return db_ != nullptr; }
  sqlite3 *getHandle() const { return db_; }
  const std::string &getPath() const { return path_; }

  Roe<void> exec(const std::string &sql);
  Roe<Statement> prepare(const std::string &sql);

  /**
   * WAL journal, synchronous=NORMAL, 5 s busy timeout, in-memory temp
   * storage, then create the schema if missing.
   */
  Roe<void> configure();

  /** Rows changed by the most recent statement on this connection */
  int getChanges() const;

  /** Map a SQLite result code to an Error with the connection's message */
  Error translate(int rc) const;

private:
  Roe<void> createSchema();

  sqlite3 *db_{ nullptr };
  std::string path_;
};

} // namespace ppi

#endif // PP_INDEXER_SQLITE_DB_H
