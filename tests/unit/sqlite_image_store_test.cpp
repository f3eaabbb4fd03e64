#include "internal/image/sqlite_image_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/sqlite/sqlite_db.hpp"

namespace {

using modsync::db::sqlite::SqliteDB;
using modsync::image::SqliteImageStore;

std::filesystem::path FreshDbPath(const std::string& test_name) {
  const auto base_dir = std::filesystem::temp_directory_path() / "modsync_sqlite_image_store_tests" / test_name;
  std::filesystem::remove_all(base_dir);
  std::filesystem::create_directories(base_dir);
  return base_dir / "thumbnails.sqlite";
}

void TestWriteThenBulkRead() {
  auto store = SqliteImageStore::Open(FreshDbPath("write_read").string(), std::chrono::seconds(0));

  const std::string png("\x89PNG\r\n\x1a\n\0\0payload", 17);
  store->Write("/thumbs/a.png", png);

  const auto hits = store->BulkRead({"/thumbs/a.png", "/thumbs/missing.png"});
  assert(hits.size() == 1);
  assert(hits.at("/thumbs/a.png") == png);
}

void TestWriteReplacesExistingEntry() {
  auto store = SqliteImageStore::Open(FreshDbPath("replace").string(), std::chrono::seconds(0));

  store->Write("/thumbs/a.png", "old");
  store->Write("/thumbs/a.png", "new");

  assert(store->BulkRead({"/thumbs/a.png"}).at("/thumbs/a.png") == "new");
}

void TestExpiredEntriesReadAsMissesAndArePruned() {
  const auto path  = FreshDbPath("expiry");
  auto       db    = std::make_shared<SqliteDB>(path.string());
  auto       store = std::make_shared<SqliteImageStore>(db, std::chrono::seconds(60));

  store->Write("/thumbs/old.png", "old");
  store->Write("/thumbs/new.png", "new");
  db->Exec("UPDATE thumbnail_cache SET stored_at = stored_at - 3600 WHERE path = '/thumbs/old.png';");

  const auto hits = store->BulkRead({"/thumbs/old.png", "/thumbs/new.png"});
  assert(hits.size() == 1);
  assert(hits.count("/thumbs/new.png") == 1);

  const auto pruned = store->Prune();
  assert(pruned == 1);
  const auto pruned_again = store->Prune();
  assert(pruned_again == 0);
}

void TestZeroMaxAgeNeverExpires() {
  const auto path  = FreshDbPath("forever");
  auto       db    = std::make_shared<SqliteDB>(path.string());
  auto       store = std::make_shared<SqliteImageStore>(db, std::chrono::seconds(0));

  store->Write("/thumbs/a.png", "A");
  db->Exec("UPDATE thumbnail_cache SET stored_at = 0;");

  assert(store->BulkRead({"/thumbs/a.png"}).size() == 1);
  const auto pruned = store->Prune();
  assert(pruned == 0);
}

void TestEntriesSurviveReopen() {
  const auto path = FreshDbPath("reopen").string();
  {
    auto store = SqliteImageStore::Open(path, std::chrono::seconds(0));
    store->Write("/thumbs/a.png", "A");
  }

  auto reopened = SqliteImageStore::Open(path, std::chrono::seconds(0));
  assert(reopened->BulkRead({"/thumbs/a.png"}).at("/thumbs/a.png") == "A");
}

} // namespace

int main() {
  TestWriteThenBulkRead();
  TestWriteReplacesExistingEntry();
  TestExpiredEntriesReadAsMissesAndArePruned();
  TestZeroMaxAgeNeverExpires();
  TestEntriesSurviveReopen();

  std::cout << "modsync_unit_sqlite_image_store: pass\n";
  return 0;
}
