#pragma once

#include <vector>

#include "internal/model/mod_record.hpp"
#include "modsync/v1/registry.pb.h"

namespace modsync::registry {

/*
  Wire → canonical record conversion.

  Archive mods are keyed by directory_name, skins by path. Skin entries may
  carry the shared fields inline or inside `base`; an entry that fills both
  throws ContractViolation. A listing with a repeated key throws
  DataIntegrityError naming the key.
*/
model::ModRecord FromWire(const modsync::v1::ModEntry& entry);
model::ModRecord FromWire(const modsync::v1::SkinModEntry& entry);

std::vector<model::ModRecord> NormalizeListing(const std::vector<modsync::v1::ModEntry>& entries);
std::vector<model::ModRecord> NormalizeListing(const std::vector<modsync::v1::SkinModEntry>& entries);

// Throws DataIntegrityError on the first repeated key.
void EnsureUniqueKeys(const std::vector<model::ModRecord>& records);

modsync::v1::ModKind ToWire(model::ModKind kind);

} // namespace modsync::registry
