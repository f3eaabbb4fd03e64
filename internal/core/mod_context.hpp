#pragma once

#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/sync/installation_coordinator.hpp"
#include "internal/sync/registry_mirror.hpp"

namespace modsync::registry {
class RegistryService;
}
namespace modsync::cache {
class ThumbnailCache;
}
namespace modsync::tasks {
class BackgroundWorker;
}

namespace modsync::core {

/*
  Everything scoped to one game root: the archive-mod and skin mirrors and
  the install coordinator. Each applied snapshot warms the thumbnail cache
  for its records.

  Destruction drains the background worker so detached work that
  references this context finishes first. Toggle futures must be settled
  before the context goes away.
*/
class ModContext {
 public:
  ModContext(std::string game_root, std::shared_ptr<modsync::registry::RegistryService> registry,
             std::shared_ptr<modsync::cache::ThumbnailCache> thumbnails, std::shared_ptr<modsync::tasks::BackgroundWorker> worker);
  ~ModContext();

  ModContext(const ModContext&)            = delete;
  ModContext& operator=(const ModContext&) = delete;

  // Refreshes mods then skins; each result is reported independently.
  std::pair<sync::RefreshResult, sync::RefreshResult> RefreshAll();

  // One render pass: starts a fresh warm tier, then resolves. Empty
  // result when no thumbnail cache is configured.
  std::unordered_map<std::string, std::string> ResolveThumbnails(const std::set<std::string>& paths);

  sync::RegistryMirror& mods() {
    return *mods_;
  }
  sync::RegistryMirror& skins() {
    return *skins_;
  }
  sync::InstallationCoordinator& installer() {
    return *installer_;
  }
  modsync::cache::ThumbnailCache& thumbnails() {
    return *thumbnails_;
  }
  const std::string& game_root() const {
    return game_root_;
  }

 private:
  void WarmThumbnails(const model::Snapshot& snapshot);

  std::string                                       game_root_;
  std::shared_ptr<modsync::cache::ThumbnailCache>   thumbnails_;
  std::shared_ptr<modsync::tasks::BackgroundWorker> worker_;

  std::shared_ptr<sync::RegistryMirror>          mods_;
  std::shared_ptr<sync::RegistryMirror>          skins_;
  std::unique_ptr<sync::InstallationCoordinator> installer_;
};

} // namespace modsync::core
