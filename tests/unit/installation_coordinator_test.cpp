#include "internal/sync/installation_coordinator.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/sync/registry_mirror.hpp"
#include "support/fakes.hpp"

namespace {

using modsync::model::ModKind;
using modsync::sync::InstallationCoordinator;
using modsync::sync::RegistryMirror;
using modsync::testing::FakeRegistry;

constexpr char kGameRoot[] = "/games/MonsterHunterWilds";

struct Harness {
  Harness() {
    registry    = std::make_shared<FakeRegistry>();
    mirror      = std::make_shared<RegistryMirror>(registry, kGameRoot, ModKind::kArchive);
    coordinator = std::make_unique<InstallationCoordinator>(registry, kGameRoot, mirror);
  }

  std::shared_ptr<FakeRegistry>            registry;
  std::shared_ptr<RegistryMirror>          mirror;
  std::unique_ptr<InstallationCoordinator> coordinator;
};

void TestOneCorruptArchiveIsIsolated() {
  Harness h;
  h.registry->corrupt_archives.insert("/downloads/Broken.zip");

  const auto  result   = h.coordinator->InstallBatch({"/downloads/FreeCam.zip", "/downloads/Broken.zip", "/downloads/BetterHUD.zip"});
  const auto& outcomes = result.outcomes;

  assert(outcomes.size() == 3);
  assert(outcomes[0].ok && outcomes[0].archive_path == "/downloads/FreeCam.zip");
  assert(!outcomes[1].ok);
  assert(outcomes[1].error.find("Failed to install mod from Broken.zip: ") == 0);
  assert(outcomes[1].error.find("no recognizable mod layout") != std::string::npos);
  assert(outcomes[2].ok && outcomes[2].archive_path == "/downloads/BetterHUD.zip");

  // exactly one refresh for the whole batch
  assert(h.registry->install_calls == 3);
  assert(h.registry->list_calls == 1);
  assert(result.refresh.has_value() && result.refresh->ok());
  assert(h.mirror->Current().records.size() == 2);
}

void TestAllFailuresSkipRefresh() {
  Harness h;
  h.registry->corrupt_archives = {"a.zip", "b.zip"};

  const auto  result   = h.coordinator->InstallBatch({"a.zip", "b.zip"});
  const auto& outcomes = result.outcomes;

  assert(outcomes.size() == 2);
  assert(!outcomes[0].ok && !outcomes[1].ok);
  assert(outcomes[0].error.find("a.zip") != std::string::npos);
  assert(h.registry->list_calls == 0);
  assert(!result.refresh.has_value());
}

void TestEmptyBatchIsNoop() {
  Harness h;

  const auto result = h.coordinator->InstallBatch({});

  assert(result.outcomes.empty());
  assert(!result.refresh.has_value());
  assert(h.registry->install_calls == 0);
  assert(h.registry->list_calls == 0);
}

void TestDuplicatePathsAreIndependentRequests() {
  Harness h;

  const auto result = h.coordinator->InstallBatch({"/downloads/FreeCam.zip", "/downloads/FreeCam.zip"});

  assert(result.outcomes.size() == 2);
  assert(h.registry->install_calls == 2);
  assert(h.registry->list_calls == 1);
}

void TestProgressEventsAreForwarded() {
  Harness h;

  std::mutex               mutex;
  std::vector<std::string> seen;
  h.coordinator->AddObserver([&](const modsync::v1::InstallEvent& event) {
    std::lock_guard lock(mutex);
    seen.push_back(event.archive_path() + ":" + event.stage());
  });

  (void)h.coordinator->InstallBatch({"x.zip", "y.zip"});

  assert(seen.size() == 2);
  for (const auto& entry : seen) {
    assert(entry == "x.zip:extracting" || entry == "y.zip:extracting");
  }
}

void TestWindowsPathReportsFileName() {
  Harness h;
  h.registry->corrupt_archives.insert("C:\\Users\\hunter\\Downloads\\Broken.zip");

  const auto result = h.coordinator->InstallBatch({"C:\\Users\\hunter\\Downloads\\Broken.zip"});

  assert(result.outcomes[0].error.find("Failed to install mod from Broken.zip: ") == 0);
}

void TestFailedRefreshAfterInstallIsReturned() {
  Harness h;
  h.registry->mods = {modsync::testing::MakeMod("BetterHUD.zip", true)};

  // the install adds a second entry under the same directory name
  const auto result = h.coordinator->InstallBatch({"/downloads/BetterHUD.zip"});

  assert(result.outcomes.size() == 1 && result.outcomes[0].ok);
  assert(result.refresh.has_value());
  assert(!result.refresh->ok());
  assert(result.refresh->listing_error.find("BetterHUD.zip") != std::string::npos);
  assert(h.mirror->LastError().has_value());
}

} // namespace

int main() {
  TestOneCorruptArchiveIsIsolated();
  TestAllFailuresSkipRefresh();
  TestEmptyBatchIsNoop();
  TestDuplicatePathsAreIndependentRequests();
  TestProgressEventsAreForwarded();
  TestWindowsPathReportsFileName();
  TestFailedRefreshAfterInstallIsReturned();

  std::cout << "modsync_unit_installation_coordinator: pass\n";
  return 0;
}
