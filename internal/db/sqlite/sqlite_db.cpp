#include "sqlite_db.hpp"

#include <stdexcept>

namespace modsync::db::sqlite {

namespace {

// The thumbnail store is a cache: losing the last writes on power failure
// is acceptable, blocking the UI on fsync is not.
constexpr const char* kPragmas[] = {
    "PRAGMA journal_mode=WAL;",
    "PRAGMA synchronous=NORMAL;",
    "PRAGMA temp_store=MEMORY;",
};

constexpr int kBusyTimeoutMs = 5000;

std::runtime_error Error(const std::string& path, const std::string& what, const std::string& detail) {
  return std::runtime_error("sqlite " + what + " (" + path + "): " + detail);
}

} // namespace

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  // FULLMUTEX: write-backs run on the background worker
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    const std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw Error(path_, "open", detail);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc == SQLITE_OK) return;

  const std::string detail = err ? err : sqlite3_errstr(rc);
  sqlite3_free(err);
  throw Error(path_, "exec", detail);
}

void SqliteDB::Configure() {
  for (const char* pragma : kPragmas) {
    Exec(pragma);
  }
  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    throw Error(path_, "busy_timeout", sqlite3_errmsg(db_));
  }
}

Statement::Statement(sqlite3* db, const std::string& sql) {
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
    const std::string detail = sqlite3_errmsg(db);
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
    throw std::runtime_error("sqlite prepare: " + detail);
  }
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

} // namespace modsync::db::sqlite
