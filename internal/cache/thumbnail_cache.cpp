#include "thumbnail_cache.hpp"

#include <stdexcept>
#include <vector>

#include "internal/image/image_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/tasks/background_worker.hpp"
#include "internal/util/errors.hpp"

namespace modsync::cache {

using modsync::observability::IntField;
using modsync::observability::StringField;

ThumbnailCache::ThumbnailCache(std::shared_ptr<modsync::image::ImageSource> source, std::shared_ptr<modsync::image::ImageCacheStore> store,
                               std::shared_ptr<modsync::tasks::BackgroundWorker> worker)
    : source_(std::move(source)), store_(std::move(store)), worker_(std::move(worker)) {
  if (!source_) throw std::invalid_argument("thumbnail cache requires an image source");
  if (!worker_) throw std::invalid_argument("thumbnail cache requires a background worker");
}

// ------------------------------------------------------------
// Resolve
// ------------------------------------------------------------

ThumbnailCache::PayloadMap ThumbnailCache::Resolve(const std::set<std::string>& paths) {
  std::lock_guard resolve_lock(resolve_mutex_);

  PayloadMap            result;
  std::set<std::string> pending;

  {
    std::lock_guard lock(mutex_);
    for (const auto& path : paths) {
      if (path.empty()) continue;

      if (auto it = warm_.find(path); it != warm_.end()) {
        result.emplace(path, it->second);
        ++stats_.warm_hits;
        continue;
      }
      if (auto it = session_.find(path); it != session_.end()) {
        result.emplace(path, it->second);
        ++stats_.session_hits;
        continue;
      }
      pending.insert(path);
    }
  }

  if (!pending.empty()) {
    ResolveBulk(&pending, &result);
  }
  if (!pending.empty()) {
    ResolveDirect(pending, &result);
  }

  {
    std::lock_guard lock(mutex_);
    for (const auto& [path, data] : result) {
      warm_.emplace(path, data);
    }
  }

  MODSYNC_LOG_DEBUG("Thumbnails resolved", {IntField("requested", static_cast<std::int64_t>(paths.size())),
                                            IntField("resolved", static_cast<std::int64_t>(result.size()))});
  return result;
}

void ThumbnailCache::ResolveBulk(std::set<std::string>* pending, PayloadMap* result) {
  if (!store_) return;

  PayloadMap hits;
  try {
    hits = store_->BulkRead(std::vector<std::string>(pending->begin(), pending->end()));
  } catch (const modsync::util::CapabilityUnavailable& e) {
    std::lock_guard lock(mutex_);
    ++stats_.bulk_unavailable;
    MODSYNC_LOG_DEBUG("Bulk thumbnail cache unavailable", {StringField("reason", e.what())});
    return;
  } catch (const std::exception& e) {
    std::lock_guard lock(mutex_);
    ++stats_.bulk_unavailable;
    MODSYNC_LOG_WARN("Bulk thumbnail cache read failed, falling back to direct reads", {StringField("error", e.what())});
    return;
  }

  std::lock_guard lock(mutex_);
  for (auto& [path, data] : hits) {
    // only answer what was asked; ignore empty payloads
    if (data.empty() || pending->erase(path) == 0) continue;

    auto [it, inserted] = session_.emplace(path, std::move(data));
    (void)inserted;
    result->emplace(path, it->second);
    ++stats_.bulk_hits;
  }
}

void ThumbnailCache::ResolveDirect(const std::set<std::string>& pending, PayloadMap* result) {
  for (const auto& path : pending) {
    std::string data;
    try {
      data = source_->ReadImage(path);
    } catch (const std::exception& e) {
      std::lock_guard lock(mutex_);
      ++stats_.direct_failures;
      MODSYNC_LOG_WARN("Thumbnail read failed", {StringField("path", path), StringField("error", e.what())});
      continue;
    }

    {
      std::lock_guard lock(mutex_);
      ++stats_.direct_reads;
      if (data.empty()) continue;

      auto [it, inserted] = session_.emplace(path, data);
      (void)inserted;
      result->emplace(path, it->second);
    }

    ScheduleWriteBack(path, data);
  }
}

void ThumbnailCache::ScheduleWriteBack(const std::string& path, const std::string& data) {
  if (!store_) return;

  auto store = store_;
  worker_->Submit("thumbnail-write-back", [store, path, data] {
    store->Write(path, data);
  });
}

// ------------------------------------------------------------
// Detached warm-up / passes
// ------------------------------------------------------------

void ThumbnailCache::Warm(std::set<std::string> paths) {
  if (paths.empty()) return;

  worker_->Submit("thumbnail-warm-up", [this, paths = std::move(paths)] {
    (void)Resolve(paths);
  });
}

void ThumbnailCache::BeginPass() {
  std::lock_guard lock(mutex_);
  warm_.clear();
}

std::optional<std::string> ThumbnailCache::Lookup(const std::string& path) const {
  std::lock_guard lock(mutex_);
  if (auto it = warm_.find(path); it != warm_.end()) return it->second;
  if (auto it = session_.find(path); it != session_.end()) return it->second;
  return std::nullopt;
}

ThumbnailCache::Stats ThumbnailCache::GetStats() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

std::size_t ThumbnailCache::SessionSize() const {
  std::lock_guard lock(mutex_);
  return session_.size();
}

} // namespace modsync::cache
