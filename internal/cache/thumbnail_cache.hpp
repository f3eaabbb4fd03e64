#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace modsync::image {
class ImageSource;
class ImageCacheStore;
}
namespace modsync::tasks {
class BackgroundWorker;
}

namespace modsync::cache {

/*
  Tiered thumbnail resolution, keyed by image path.

  Lookup order for every path:

    1. warm     result map of the current render pass (BeginPass clears it)
    2. session  process-lifetime map, append-only
    3. bulk     one batched read from the persistent store, fail-open
    4. direct   per-path read from the image source; hits are written back
                to the persistent store on the background worker

  A path that misses every tier is absent from the result and the caller
  renders a placeholder. A failed read never affects other paths.
*/
class ThumbnailCache {
 public:
  using PayloadMap = std::unordered_map<std::string, std::string>;

  struct Stats {
    uint64_t warm_hits        = 0;
    uint64_t session_hits     = 0;
    uint64_t bulk_hits        = 0;
    uint64_t direct_reads     = 0;
    uint64_t direct_failures  = 0;
    uint64_t bulk_unavailable = 0;
  };

  // store may be null: the bulk tier is then skipped and nothing is written back.
  ThumbnailCache(std::shared_ptr<modsync::image::ImageSource> source, std::shared_ptr<modsync::image::ImageCacheStore> store,
                 std::shared_ptr<modsync::tasks::BackgroundWorker> worker);

  PayloadMap Resolve(const std::set<std::string>& paths);

  // Detached Resolve on the background worker.
  void Warm(std::set<std::string> paths);

  void BeginPass();

  // Warm or session hit only; never performs I/O.
  std::optional<std::string> Lookup(const std::string& path) const;

  Stats       GetStats() const;
  std::size_t SessionSize() const;

 private:
  void ResolveBulk(std::set<std::string>* pending, PayloadMap* result);
  void ResolveDirect(const std::set<std::string>& pending, PayloadMap* result);
  void ScheduleWriteBack(const std::string& path, const std::string& data);

  std::shared_ptr<modsync::image::ImageSource>      source_;
  std::shared_ptr<modsync::image::ImageCacheStore>  store_;
  std::shared_ptr<modsync::tasks::BackgroundWorker> worker_;

  // Serializes Resolve so a path is read at most once per session.
  std::mutex resolve_mutex_;

  mutable std::mutex mutex_;
  PayloadMap         warm_;
  PayloadMap         session_;
  Stats              stats_;
};

} // namespace modsync::cache
