#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/model/mod_record.hpp"

namespace modsync::registry {
class RegistryService;
}

namespace modsync::sync {

struct ReconcileReport {
  bool         ok = true;
  std::string  error;
  std::int64_t discovered = 0;
  std::int64_t removed    = 0;
};

/*
  Asks the registry to rescan one game root so mods added or removed on
  disk are picked up before the next listing. Never throws; failures are
  returned in the report.
*/
class ReconciliationScanner {
 public:
  ReconciliationScanner(std::shared_ptr<modsync::registry::RegistryService> registry, std::string game_root, model::ModKind kind);

  ReconcileReport Reconcile();

 private:
  std::shared_ptr<modsync::registry::RegistryService> registry_;
  std::string                                         game_root_;
  model::ModKind                                      kind_;
};

} // namespace modsync::sync
