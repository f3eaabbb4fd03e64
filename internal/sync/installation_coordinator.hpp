#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/sync/registry_mirror.hpp"
#include "modsync/v1/registry.pb.h"

namespace modsync::registry {
class RegistryService;
}

namespace modsync::sync {

struct InstallationOutcome {
  std::string archive_path;
  bool        ok = false;
  // "Failed to install mod from <filename>: <reason>" when !ok
  std::string error;
};

struct InstallBatchResult {
  std::vector<InstallationOutcome> outcomes;
  // present when at least one install succeeded and the mirror was refreshed
  std::optional<RefreshResult> refresh;
};

/*
  Installs a batch of archives concurrently and settles all of them.

  One failing archive never affects the others. When at least one install
  succeeded the mirror is refreshed exactly once after the whole batch
  settles. Outcomes come back in submission order.
*/
class InstallationCoordinator {
 public:
  using ProgressObserver = std::function<void(const modsync::v1::InstallEvent&)>;

  InstallationCoordinator(std::shared_ptr<modsync::registry::RegistryService> registry, std::string game_root,
                          std::shared_ptr<RegistryMirror> mirror);

  // Observers may be called from several install threads; calls are serialized.
  void AddObserver(ProgressObserver observer);

  InstallBatchResult InstallBatch(const std::vector<std::string>& archive_paths);

 private:
  InstallationOutcome InstallOne(const std::string& archive_path);
  void                Forward(const modsync::v1::InstallEvent& event);

  std::shared_ptr<modsync::registry::RegistryService> registry_;
  std::string                                         game_root_;
  std::shared_ptr<RegistryMirror>                     mirror_;

  std::mutex                    observers_mutex_;
  std::vector<ProgressObserver> observers_;
};

} // namespace modsync::sync
