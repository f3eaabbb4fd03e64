#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/toggle_state.hpp"

namespace modsync::model {

enum class ModKind : std::uint8_t {
  kArchive = 1,
  kSkin    = 2,
};

enum class ModType : std::uint8_t {
  kUnspecified        = 0,
  kREFrameworkPlugin  = 1,
  kREFrameworkAutorun = 2,
  kSkinMod            = 3,
  kNativesMod         = 4,
  kOther              = 5,
};

constexpr const char* ToString(ModKind kind) {
  return kind == ModKind::kSkin ? "skin" : "archive";
}

/*
  Canonical record for both archive mods and skins.

  `key` is the identity used by the registry: directory_name for archive
  mods, path for skins.
*/
struct ModRecord {
  ModKind     kind = ModKind::kArchive;
  std::string key;

  std::string name;
  std::string directory_name;
  std::string path;
  bool        enabled = false;

  std::optional<std::string> author;
  std::optional<std::string> version;
  std::optional<std::string> description;
  std::optional<std::string> source;
  std::optional<std::string> thumbnail_path;

  std::int64_t installed_timestamp = 0;
  ModType      mod_type            = ModType::kUnspecified;

  std::vector<std::string> conflicts;

  ToggleState toggle_state = ToggleState::kSynced;

  bool IsOptimistic() const {
    return toggle_state == ToggleState::kPending || toggle_state == ToggleState::kConfirmed;
  }
};

inline bool operator==(const ModRecord& a, const ModRecord& b) {
  return a.kind == b.kind && a.key == b.key && a.name == b.name && a.directory_name == b.directory_name && a.path == b.path &&
         a.enabled == b.enabled && a.author == b.author && a.version == b.version && a.description == b.description &&
         a.source == b.source && a.thumbnail_path == b.thumbnail_path && a.installed_timestamp == b.installed_timestamp &&
         a.mod_type == b.mod_type && a.conflicts == b.conflicts && a.toggle_state == b.toggle_state;
}

inline bool operator!=(const ModRecord& a, const ModRecord& b) {
  return !(a == b);
}

/*
  Snapshot of one registry listing as last applied to a mirror.
*/
struct Snapshot {
  std::vector<ModRecord> records;
  uint64_t               generation = 0;
  std::int64_t           synced_at  = 0;
};

} // namespace modsync::model
