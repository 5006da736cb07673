#include "sqlite_db.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace roadcast::db::sqlite {

namespace {

// Writers wait this long for the file lock held by another process.
constexpr int kBusyTimeoutMs = 5000;

bool InMemory(const std::string& path) {
  return path.empty() || path == ":memory:";
}

void EnsureParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw std::runtime_error("sqlite: cannot create " + parent.string() + ": " + ec.message());
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(InMemory(path) ? ":memory:" : std::move(path)) {
  if (!InMemory(path_)) EnsureParentDirectory(path_);

  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  Configure();
  ROADCAST_LOG_INFO("sqlite database opened", {observability::StringField("path", path_)});
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  std::string msg = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw std::runtime_error("sqlite: " + msg);
}

void SqliteDB::Configure() {
  // WAL lets a second process read the graph while we write
  if (!InMemory(path_)) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");

  // off by default in sqlite; edges reference nodes, routes reference places
  Exec("PRAGMA foreign_keys=ON;");

  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite busy_timeout: ") + sqlite3_errmsg(db_));
  }

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace roadcast::db::sqlite
