#include "sqlite_image_store.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <stdexcept>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace modsync::image {

using modsync::db::sqlite::SqliteDB;
using modsync::db::sqlite::Statement;

namespace {

constexpr char kSchema[] =
    "CREATE TABLE IF NOT EXISTS thumbnail_cache ("
    "path TEXT PRIMARY KEY, "
    "data BLOB NOT NULL, "
    "stored_at INTEGER NOT NULL);";

void ThrowIfStep(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteImageStore::SqliteImageStore(std::shared_ptr<SqliteDB> db, std::chrono::seconds max_age)
    : db_(std::move(db)), max_age_(max_age) {
  db_->Exec(kSchema);
}

std::shared_ptr<SqliteImageStore> SqliteImageStore::Open(const std::string& path, std::chrono::seconds max_age) {
  const auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }

  auto db = std::make_shared<SqliteDB>(path);
  MODSYNC_LOG_DEBUG("Thumbnail store opened", {modsync::observability::StringField("path", path)});
  return std::make_shared<SqliteImageStore>(std::move(db), max_age);
}

bool SqliteImageStore::IsExpired(std::int64_t stored_at, std::int64_t now) const {
  return max_age_.count() > 0 && now - stored_at > max_age_.count();
}

std::unordered_map<std::string, std::string> SqliteImageStore::BulkRead(const std::vector<std::string>& paths) {
  std::unordered_map<std::string, std::string> result;
  if (paths.empty()) {
    return result;
  }

  auto*      db  = db_->Handle();
  const auto now = modsync::util::ToUnixSeconds(modsync::util::Now());

  Statement st(db, "SELECT data, stored_at FROM thumbnail_cache WHERE path = ?;");

  for (const auto& path : paths) {
    sqlite3_reset(st.get());
    sqlite3_bind_text(st.get(), 1, path.c_str(), -1, SQLITE_TRANSIENT);

    const int rc = sqlite3_step(st.get());
    ThrowIfStep(rc, db, "thumbnail lookup");
    if (rc != SQLITE_ROW) {
      continue;
    }

    const auto stored_at = sqlite3_column_int64(st.get(), 1);
    if (IsExpired(stored_at, now)) {
      MODSYNC_LOG_DEBUG("Cached thumbnail expired", {modsync::observability::StringField("path", path)});
      continue;
    }

    const auto* blob = static_cast<const char*>(sqlite3_column_blob(st.get(), 0));
    const int   size = sqlite3_column_bytes(st.get(), 0);
    result.emplace(path, std::string(blob ? blob : "", static_cast<size_t>(size)));
  }

  MODSYNC_LOG_DEBUG("Thumbnail store lookup", {modsync::observability::IntField("requested", static_cast<std::int64_t>(paths.size())),
                                               modsync::observability::IntField("hits", static_cast<std::int64_t>(result.size()))});
  return result;
}

void SqliteImageStore::Write(const std::string& path, const std::string& data) {
  auto* db = db_->Handle();

  Statement st(db, "INSERT OR REPLACE INTO thumbnail_cache(path, data, stored_at) VALUES(?, ?, ?);");
  sqlite3_bind_text(st.get(), 1, path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(st.get(), 2, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(st.get(), 3, modsync::util::ToUnixSeconds(modsync::util::Now()));

  ThrowIfStep(sqlite3_step(st.get()), db, "thumbnail write");
}

std::int64_t SqliteImageStore::Prune() {
  if (max_age_.count() <= 0) {
    return 0;
  }

  auto*      db     = db_->Handle();
  const auto cutoff = modsync::util::ToUnixSeconds(modsync::util::Now()) - max_age_.count();

  Statement st(db, "DELETE FROM thumbnail_cache WHERE stored_at < ?;");
  sqlite3_bind_int64(st.get(), 1, cutoff);
  ThrowIfStep(sqlite3_step(st.get()), db, "thumbnail prune");

  return sqlite3_changes(db);
}

} // namespace modsync::image
