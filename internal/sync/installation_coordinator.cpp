#include "installation_coordinator.hpp"

#include <future>

#include "internal/observability/logging.hpp"
#include "internal/registry/registry_service.hpp"
#include "internal/util/path_utils.hpp"

namespace modsync::sync {

using modsync::observability::IntField;
using modsync::observability::StringField;

InstallationCoordinator::InstallationCoordinator(std::shared_ptr<modsync::registry::RegistryService> registry, std::string game_root,
                                                 std::shared_ptr<RegistryMirror> mirror)
    : registry_(std::move(registry)), game_root_(std::move(game_root)), mirror_(std::move(mirror)) {
}

void InstallationCoordinator::AddObserver(ProgressObserver observer) {
  std::lock_guard lock(observers_mutex_);
  observers_.push_back(std::move(observer));
}

InstallBatchResult InstallationCoordinator::InstallBatch(const std::vector<std::string>& archive_paths) {
  InstallBatchResult result;
  if (archive_paths.empty()) return result;

  std::vector<std::future<InstallationOutcome>> pending;
  pending.reserve(archive_paths.size());
  for (const auto& path : archive_paths) {
    pending.push_back(std::async(std::launch::async, [this, path] {
      return InstallOne(path);
    }));
  }

  // settle-all: every future is joined, in submission order
  auto& outcomes = result.outcomes;
  outcomes.reserve(pending.size());
  std::size_t succeeded = 0;
  for (auto& f : pending) {
    outcomes.push_back(f.get());
    if (outcomes.back().ok) ++succeeded;
  }

  MODSYNC_LOG_INFO("Install batch settled", {IntField("submitted", static_cast<std::int64_t>(outcomes.size())),
                                             IntField("succeeded", static_cast<std::int64_t>(succeeded))});

  if (succeeded > 0 && mirror_) {
    result.refresh = mirror_->Refresh();
    if (!result.refresh->ok()) {
      MODSYNC_LOG_WARN("Refresh after install failed", {StringField("error", result.refresh->listing_error)});
    }
  }
  return result;
}

InstallationOutcome InstallationCoordinator::InstallOne(const std::string& archive_path) {
  InstallationOutcome outcome;
  outcome.archive_path = archive_path;

  try {
    registry_->InstallFromArchive(archive_path, game_root_, [this](const modsync::v1::InstallEvent& event) {
      Forward(event);
    });
    outcome.ok = true;
  } catch (const std::exception& e) {
    outcome.error = "Failed to install mod from " + modsync::util::FileName(archive_path) + ": " + e.what();
    MODSYNC_LOG_ERROR(outcome.error, {StringField("archive", archive_path)});
  }
  return outcome;
}

void InstallationCoordinator::Forward(const modsync::v1::InstallEvent& event) {
  std::lock_guard lock(observers_mutex_);
  for (const auto& observer : observers_) {
    try {
      observer(event);
    } catch (const std::exception& e) {
      MODSYNC_LOG_WARN("Install observer failed", {StringField("error", e.what())});
    }
  }
}

} // namespace modsync::sync
