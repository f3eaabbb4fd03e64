#include "mod_context.hpp"

#include <set>
#include <stdexcept>

#include "internal/cache/thumbnail_cache.hpp"
#include "internal/observability/logging.hpp"
#include "internal/tasks/background_worker.hpp"

namespace modsync::core {

using modsync::model::ModKind;
using modsync::observability::StringField;

ModContext::ModContext(std::string game_root, std::shared_ptr<modsync::registry::RegistryService> registry,
                       std::shared_ptr<modsync::cache::ThumbnailCache> thumbnails, std::shared_ptr<modsync::tasks::BackgroundWorker> worker)
    : game_root_(std::move(game_root)), thumbnails_(std::move(thumbnails)), worker_(std::move(worker)) {
  if (game_root_.empty()) throw std::invalid_argument("mod context requires a game root");
  if (!registry) throw std::invalid_argument("mod context requires a registry service");

  mods_      = std::make_shared<sync::RegistryMirror>(registry, game_root_, ModKind::kArchive);
  skins_     = std::make_shared<sync::RegistryMirror>(registry, game_root_, ModKind::kSkin);
  installer_ = std::make_unique<sync::InstallationCoordinator>(registry, game_root_, mods_);

  if (thumbnails_) {
    auto warm = [this](const model::Snapshot& snapshot) {
      WarmThumbnails(snapshot);
    };
    mods_->Subscribe(warm);
    skins_->Subscribe(warm);
  }

  MODSYNC_LOG_INFO("Mod context ready", {StringField("game_root", game_root_)});
}

ModContext::~ModContext() {
  if (worker_) worker_->Drain();
}

std::pair<sync::RefreshResult, sync::RefreshResult> ModContext::RefreshAll() {
  auto mods  = mods_->Refresh();
  auto skins = skins_->Refresh();
  return {std::move(mods), std::move(skins)};
}

std::unordered_map<std::string, std::string> ModContext::ResolveThumbnails(const std::set<std::string>& paths) {
  if (!thumbnails_) return {};

  thumbnails_->BeginPass();
  return thumbnails_->Resolve(paths);
}

void ModContext::WarmThumbnails(const model::Snapshot& snapshot) {
  std::set<std::string> paths;
  for (const auto& record : snapshot.records) {
    if (record.thumbnail_path) paths.insert(*record.thumbnail_path);
  }
  thumbnails_->Warm(std::move(paths));
}

} // namespace modsync::core
