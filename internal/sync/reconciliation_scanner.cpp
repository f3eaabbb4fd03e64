#include "reconciliation_scanner.hpp"

#include "internal/observability/logging.hpp"
#include "internal/registry/record_normalizer.hpp"
#include "internal/registry/registry_service.hpp"

namespace modsync::sync {

using modsync::observability::IntField;
using modsync::observability::StringField;

ReconciliationScanner::ReconciliationScanner(std::shared_ptr<modsync::registry::RegistryService> registry, std::string game_root,
                                             model::ModKind kind)
    : registry_(std::move(registry)), game_root_(std::move(game_root)), kind_(kind) {
}

ReconcileReport ReconciliationScanner::Reconcile() {
  ReconcileReport report;

  try {
    const auto resp   = registry_->Rescan(game_root_, modsync::registry::ToWire(kind_));
    report.discovered = resp.discovered();
    report.removed    = resp.removed();
  } catch (const std::exception& e) {
    report.ok    = false;
    report.error = e.what();
    MODSYNC_LOG_WARN("Reconciliation failed",
                     {StringField("game_root", game_root_), StringField("kind", model::ToString(kind_)), StringField("error", e.what())});
    return report;
  }

  MODSYNC_LOG_INFO("Reconciliation complete", {StringField("game_root", game_root_), StringField("kind", model::ToString(kind_)),
                                               IntField("discovered", report.discovered), IntField("removed", report.removed)});
  return report;
}

} // namespace modsync::sync
