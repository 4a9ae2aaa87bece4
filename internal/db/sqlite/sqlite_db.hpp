#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/result.hpp"

namespace jobq::db::sqlite {

struct SqliteOptions {
  std::string path            = "jobq.db";
  bool        wal_mode        = true;
  int         busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection may be shared by many threads. SQLite transactions are
  per-connection, so TxMutex() serializes transactions opened on the same
  SqliteDB. Separate SqliteDB instances on one file contend through the
  database lock and busy timeout instead.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return options_.path;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (pragmas, schema, transaction control).
  // Throws util::StoreError.
  void Exec(const std::string& sql);

  // Configure PRAGMAs (WAL, synchronous, busy timeout).
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

// Maps a sqlite result code onto db::ErrorCode.
jobq::db::ErrorCode ToErrorCode(int rc);

} // namespace jobq::db::sqlite
