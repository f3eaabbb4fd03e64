#pragma once

#include <functional>
#include <string>
#include <vector>

#include "modsync/v1/registry.pb.h"

namespace modsync::registry {

/*
  Capability surface the core needs from the Registry Service.

  The registry is the source of truth for installed mods and skins and
  their enabled state. Implementations:

  - are called concurrently from worker threads
  - report failures with the exceptions in internal/util/errors.hpp
  - return wire records as-is; normalization happens in the mirror
*/
class RegistryService {
 public:
  using InstallEventCallback = std::function<void(const modsync::v1::InstallEvent&)>;

  virtual ~RegistryService() = default;

  // Discover mods added or removed on disk and merge them into the registry.
  virtual modsync::v1::RescanResponse Rescan(const std::string& game_root, modsync::v1::ModKind kind) = 0;

  virtual std::vector<modsync::v1::ModEntry>     ListMods(const std::string& game_root)  = 0;
  virtual std::vector<modsync::v1::SkinModEntry> ListSkins(const std::string& game_root) = 0;

  // on_event may be empty; events are advisory.
  virtual void InstallFromArchive(const std::string& archive_path, const std::string& game_root, const InstallEventCallback& on_event) = 0;

  virtual void SetEnabled(const std::string& key, modsync::v1::ModKind kind, const std::string& game_root, bool enabled) = 0;

  virtual void Delete(const std::string& key, modsync::v1::ModKind kind, const std::string& game_root) = 0;
};

} // namespace modsync::registry
