#include "record_normalizer.hpp"

#include <optional>
#include <string>
#include <unordered_set>

#include "internal/util/errors.hpp"
#include "internal/util/path_utils.hpp"

namespace modsync::registry {

using namespace modsync::v1;
using modsync::model::ModKind;
using modsync::model::ModRecord;
using modsync::model::ModType;

namespace {

std::optional<std::string> Optional(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

ModType ToModType(modsync::v1::ModType type) {
  switch (type) {
    case MOD_TYPE_REFRAMEWORK_PLUGIN:
      return ModType::kREFrameworkPlugin;
    case MOD_TYPE_REFRAMEWORK_AUTORUN:
      return ModType::kREFrameworkAutorun;
    case MOD_TYPE_SKIN_MOD:
      return ModType::kSkinMod;
    case MOD_TYPE_NATIVES_MOD:
      return ModType::kNativesMod;
    case MOD_TYPE_OTHER:
      return ModType::kOther;
    default:
      return ModType::kUnspecified;
  }
}

void ApplyFields(const ModFields& fields, ModRecord* record) {
  record->name                = fields.name();
  record->directory_name      = fields.directory_name();
  record->path                = fields.path();
  record->enabled             = fields.enabled();
  record->author              = Optional(fields.author());
  record->version             = Optional(fields.version());
  record->description         = Optional(fields.description());
  record->source              = Optional(fields.source());
  record->installed_timestamp = fields.installed_timestamp();
  record->mod_type            = ToModType(fields.mod_type());
}

bool HasFlatFields(const SkinModEntry& entry) {
  return !entry.name().empty() || !entry.directory_name().empty() || !entry.path().empty() || entry.enabled() || !entry.author().empty() ||
         !entry.version().empty() || !entry.description().empty() || !entry.source().empty() || entry.installed_timestamp() != 0;
}

ModFields FlatFields(const SkinModEntry& entry) {
  ModFields fields;
  fields.set_name(entry.name());
  fields.set_directory_name(entry.directory_name());
  fields.set_path(entry.path());
  fields.set_enabled(entry.enabled());
  fields.set_author(entry.author());
  fields.set_version(entry.version());
  fields.set_description(entry.description());
  fields.set_source(entry.source());
  fields.set_installed_timestamp(entry.installed_timestamp());
  fields.set_mod_type(MOD_TYPE_SKIN_MOD);
  return fields;
}

} // namespace

ModRecord FromWire(const ModEntry& entry) {
  ModRecord record;
  record.kind = ModKind::kArchive;
  ApplyFields(entry.fields(), &record);
  record.thumbnail_path = Optional(entry.thumbnail_path());
  record.key            = record.directory_name;

  if (record.key.empty()) {
    throw modsync::util::ContractViolation("mod entry '" + record.name + "' has no directory_name");
  }
  return record;
}

ModRecord FromWire(const SkinModEntry& entry) {
  const bool flat   = HasFlatFields(entry);
  const bool nested = entry.has_base();

  if (flat && nested) {
    throw modsync::util::ContractViolation("skin entry '" + (entry.path().empty() ? entry.base().path() : entry.path()) +
                                           "' carries both flat fields and a base record");
  }

  ModRecord record;
  record.kind = ModKind::kSkin;
  ApplyFields(nested ? entry.base() : FlatFields(entry), &record);
  record.thumbnail_path = Optional(entry.thumbnail_path());
  record.conflicts.assign(entry.conflicts().begin(), entry.conflicts().end());
  record.key = record.path;

  if (record.key.empty()) {
    throw modsync::util::ContractViolation("skin entry '" + record.name + "' has no path");
  }
  if (record.directory_name.empty()) {
    record.directory_name = modsync::util::FileName(record.path);
  }
  if (record.name.empty()) {
    record.name = record.directory_name;
  }
  return record;
}

void EnsureUniqueKeys(const std::vector<ModRecord>& records) {
  std::unordered_set<std::string> seen;
  seen.reserve(records.size());

  for (const auto& record : records) {
    if (!seen.insert(record.key).second) {
      throw modsync::util::DataIntegrityError(std::string("registry listed ") + model::ToString(record.kind) + " '" + record.key +
                                              "' more than once");
    }
  }
}

std::vector<ModRecord> NormalizeListing(const std::vector<ModEntry>& entries) {
  std::vector<ModRecord> records;
  records.reserve(entries.size());
  for (const auto& entry : entries) {
    records.push_back(FromWire(entry));
  }
  EnsureUniqueKeys(records);
  return records;
}

std::vector<ModRecord> NormalizeListing(const std::vector<SkinModEntry>& entries) {
  std::vector<ModRecord> records;
  records.reserve(entries.size());
  for (const auto& entry : entries) {
    records.push_back(FromWire(entry));
  }
  EnsureUniqueKeys(records);
  return records;
}

modsync::v1::ModKind ToWire(ModKind kind) {
  return kind == ModKind::kSkin ? MOD_KIND_SKIN : MOD_KIND_ARCHIVE;
}

} // namespace modsync::registry
