#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace streak::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the process. SqliteTransaction holds
  TxMutex() for its whole lifetime because a connection can only run
  one transaction at a time.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace streak::db::sqlite
