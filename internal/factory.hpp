#pragma once

#include <memory>

#include "config/config.pb.h"

namespace modsync::registry {
class RegistryService;
}
namespace modsync::image {
class ImageSource;
class ImageCacheStore;
}
namespace modsync::tasks {
class BackgroundWorker;
}
namespace modsync::cache {
class ThumbnailCache;
}
namespace modsync::core {
class ModContext;
}

namespace modsync::factory {

/*
  Application

  Owns every long-lived object of one modsyncctl run. Members are
  destroyed bottom-up: the context drains the worker before the cache
  and worker go away.
*/
struct Application {
  std::shared_ptr<modsync::registry::RegistryService> registry;
  std::shared_ptr<modsync::image::ImageSource>        images;
  // null when neither the local store nor the remote cache is usable
  std::shared_ptr<modsync::image::ImageCacheStore> image_store;

  std::shared_ptr<modsync::tasks::BackgroundWorker> worker;
  std::shared_ptr<modsync::cache::ThumbnailCache>   thumbnails;

  std::unique_ptr<modsync::core::ModContext> context;

  Application();
  ~Application();
  Application(Application&&) noexcept;
  Application& operator=(Application&&) noexcept;
};

/*
  Build

  Composition root: the only place that knows the concrete gRPC clients
  and the SQLite store.
*/
Application Build(const modsync::runtime::config::RuntimeConfig& config);

} // namespace modsync::factory
