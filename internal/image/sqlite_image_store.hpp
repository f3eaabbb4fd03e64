#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/image/image_service.hpp"

namespace modsync::db::sqlite {
class SqliteDB;
}

namespace modsync::image {

/*
  Persistent thumbnail tier on local disk.

  One row per image path holding the encoded bytes and the time they were
  stored. With max_age of zero entries never expire; otherwise older rows
  read as misses and are replaced by the next write-back.
*/
class SqliteImageStore final : public ImageCacheStore {
 public:
  SqliteImageStore(std::shared_ptr<modsync::db::sqlite::SqliteDB> db, std::chrono::seconds max_age);

  // Creates parent directories and the schema.
  static std::shared_ptr<SqliteImageStore> Open(const std::string& path, std::chrono::seconds max_age);

  std::unordered_map<std::string, std::string> BulkRead(const std::vector<std::string>& paths) override;

  void Write(const std::string& path, const std::string& data) override;

  // Drops every expired row; returns the number removed.
  std::int64_t Prune();

 private:
  bool IsExpired(std::int64_t stored_at, std::int64_t now) const;

  std::shared_ptr<modsync::db::sqlite::SqliteDB> db_;
  std::chrono::seconds                           max_age_;
};

} // namespace modsync::image
