#include "factory.hpp"

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <chrono>
#include <memory>

#include "internal/cache/thumbnail_cache.hpp"
#include "internal/core/mod_context.hpp"
#include "internal/grpc/image_client.hpp"
#include "internal/grpc/registry_client.hpp"
#include "internal/image/sqlite_image_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/tasks/background_worker.hpp"
#include "internal/tasks/task_queue.hpp"

namespace modsync::factory {

using modsync::observability::BoolField;
using modsync::observability::IntField;
using modsync::observability::StringField;

Application::Application()                                  = default;
Application::~Application()                                 = default;
Application::Application(Application&&) noexcept            = default;
Application& Application::operator=(Application&&) noexcept = default;

namespace {

std::shared_ptr<modsync::image::ImageCacheStore> BuildImageStore(const modsync::runtime::config::RuntimeConfig& config,
                                                                 const std::shared_ptr<modsync::grpc::ImageClient>& image_client) {
  if (config.images().remote_cache()) {
    return image_client;
  }

  const auto& store = config.thumbnail_store();
  try {
    auto       sqlite = modsync::image::SqliteImageStore::Open(store.path(), std::chrono::seconds(store.max_age_seconds()));
    const auto pruned = sqlite->Prune();
    MODSYNC_LOG_DEBUG("Expired thumbnails pruned", {StringField("path", store.path()), IntField("pruned", pruned)});
    return sqlite;
  } catch (const std::exception& e) {
    // thumbnails still resolve through the image service
    MODSYNC_LOG_WARN("Thumbnail store unavailable", {StringField("path", store.path()), StringField("error", e.what())});
    return nullptr;
  }
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const modsync::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Transport
  // ------------------------------------------------------------------
  auto registry_channel = ::grpc::CreateChannel(config.registry().endpoint(), ::grpc::InsecureChannelCredentials());
  auto images_channel   = ::grpc::CreateChannel(config.images().endpoint(), ::grpc::InsecureChannelCredentials());

  app.registry =
      std::make_shared<modsync::grpc::RegistryClient>(registry_channel, std::chrono::milliseconds(config.registry().deadline_ms()));

  auto image_client = std::make_shared<modsync::grpc::ImageClient>(images_channel, std::chrono::milliseconds(config.images().deadline_ms()));
  app.images        = image_client;
  app.image_store   = BuildImageStore(config, image_client);

  // ------------------------------------------------------------------
  // Background work
  // ------------------------------------------------------------------
  app.worker = std::make_shared<modsync::tasks::BackgroundWorker>(std::make_shared<modsync::tasks::TaskQueue>());
  app.worker->Start();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.thumbnails = std::make_shared<modsync::cache::ThumbnailCache>(app.images, app.image_store, app.worker);
  app.context    = std::make_unique<modsync::core::ModContext>(config.game().game_root_path(), app.registry, app.thumbnails, app.worker);

  MODSYNC_LOG_INFO("Runtime built", {StringField("registry", config.registry().endpoint()), StringField("images", config.images().endpoint()),
                                     BoolField("persistent_thumbnails", app.image_store != nullptr)});
  return app;
}

} // namespace modsync::factory
