#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace roadcast::db::sqlite {

/*
  One shared sqlite3 connection for the whole process.

  Opened FULLMUTEX; transactions are serialized through WriterMutex()
  because sqlite allows one open transaction per connection. The parent
  directory of a file path is created on open.
*/
class SqliteDB {
 public:
  // ":memory:" gives a private in-memory database (tests).
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& WriterMutex() {
    return writer_mutex_;
  }

  // Runs one or more statements; throws std::runtime_error with the
  // statement's error text.
  void Exec(const std::string& sql);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  writer_mutex_;
};

} // namespace roadcast::db::sqlite
