#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace cascade::db::sqlite {

/*
  Thin RAII wrapper around a shared sqlite3* connection.

  The connection is shared by every transaction, so transactions are
  serialized through TransactionMutex().
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

  // Execute a SQL string (used for pragmas and the bootstrap schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Apply the bootstrap schema.
  void Bootstrap();

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace cascade::db::sqlite
