#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace upload::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by the process, so transactions on it are
  serialized through TxMutex().
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

  // Execute a SQL string (used for pragmas and schema bootstrap)
  void Exec(const std::string& sql);

  /*
    Applies `statements` in one transaction and records `version` in
    PRAGMA user_version. A database already at or above `version` is left
    untouched. Returns true when the statements ran.
  */
  bool ApplySchema(const std::vector<std::string>& statements, int version);

  int UserVersion();

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace upload::db::sqlite
