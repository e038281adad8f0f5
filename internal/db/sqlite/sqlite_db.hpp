#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace impact::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by all transactions; SqliteTransaction holds
  Mutex() for its whole lifetime so BEGIN IMMEDIATE ... COMMIT blocks never
  interleave on the connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& Mutex() {
    return mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure(bool wal_mode);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

} // namespace impact::db::sqlite
