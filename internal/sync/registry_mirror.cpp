#include "registry_mirror.hpp"

#include "internal/observability/logging.hpp"
#include "internal/registry/record_normalizer.hpp"
#include "internal/registry/registry_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace modsync::sync {

using modsync::model::ModKind;
using modsync::model::ModRecord;
using modsync::model::ToggleState;
using modsync::observability::BoolField;
using modsync::observability::IntField;
using modsync::observability::StringField;

RegistryMirror::RegistryMirror(std::shared_ptr<modsync::registry::RegistryService> registry, std::string game_root, ModKind kind)
    : registry_(registry), game_root_(std::move(game_root)), kind_(kind), scanner_(std::move(registry), game_root_, kind) {
}

// ------------------------------------------------------------
// Refresh
// ------------------------------------------------------------

std::vector<ModRecord> RegistryMirror::FetchListing() {
  if (kind_ == ModKind::kSkin) {
    return modsync::registry::NormalizeListing(registry_->ListSkins(game_root_));
  }
  return modsync::registry::NormalizeListing(registry_->ListMods(game_root_));
}

RefreshResult RegistryMirror::Refresh() {
  RefreshResult result;
  result.ticket = ++next_ticket_;

  result.reconcile = scanner_.Reconcile();
  if (!result.reconcile.ok) {
    result.reconcile_error = result.reconcile.error;
  }

  std::vector<ModRecord> records;
  try {
    records = FetchListing();
  } catch (const std::exception& e) {
    result.listing_error = e.what();

    std::lock_guard lock(mutex_);
    result.generation = snapshot_.generation;
    if (result.ticket < applied_ticket_) {
      result.stale = true;
      return result;
    }
    last_error_ = result.listing_error;
    MODSYNC_LOG_WARN("Registry listing failed, keeping previous snapshot",
                     {StringField("game_root", game_root_), StringField("kind", model::ToString(kind_)), StringField("error", e.what()),
                      IntField("generation", static_cast<std::int64_t>(snapshot_.generation))});
    return result;
  }

  model::Snapshot published;
  {
    std::lock_guard lock(mutex_);
    if (result.ticket < applied_ticket_) {
      result.stale      = true;
      result.generation = snapshot_.generation;
      MODSYNC_LOG_DEBUG("Discarding stale registry listing", {IntField("ticket", static_cast<std::int64_t>(result.ticket)),
                                                              IntField("applied", static_cast<std::int64_t>(applied_ticket_))});
      return result;
    }

    // unsettled toggles keep their optimistic value until they settle
    for (auto& record : records) {
      if (auto it = inflight_.find(record.key); it != inflight_.end()) {
        record.enabled      = it->second;
        record.toggle_state = ToggleState::kPending;
      }
    }

    snapshot_.records   = std::move(records);
    snapshot_.synced_at = modsync::util::ToUnixSeconds(modsync::util::Now());
    ++snapshot_.generation;
    applied_ticket_ = result.ticket;
    last_error_.reset();

    result.generation = snapshot_.generation;
    published         = snapshot_;
  }

  MODSYNC_LOG_DEBUG("Registry snapshot applied", {StringField("kind", model::ToString(kind_)),
                                                  IntField("records", static_cast<std::int64_t>(published.records.size())),
                                                  IntField("generation", static_cast<std::int64_t>(published.generation))});
  Publish(published);
  return result;
}

RefreshResult RegistryMirror::Retry() {
  MODSYNC_LOG_INFO("Retrying registry refresh", {StringField("game_root", game_root_), StringField("kind", model::ToString(kind_))});
  return Refresh();
}

std::optional<std::string> RegistryMirror::LastError() const {
  std::lock_guard lock(mutex_);
  return last_error_;
}

model::Snapshot RegistryMirror::Current() const {
  std::lock_guard lock(mutex_);
  return snapshot_;
}

std::optional<ModRecord> RegistryMirror::Find(const std::string& key) const {
  std::lock_guard lock(mutex_);
  for (const auto& record : snapshot_.records) {
    if (record.key == key) return record;
  }
  return std::nullopt;
}

ModRecord* RegistryMirror::FindLocked(const std::string& key) {
  for (auto& record : snapshot_.records) {
    if (record.key == key) return &record;
  }
  return nullptr;
}

// ------------------------------------------------------------
// Optimistic toggle
// ------------------------------------------------------------

std::future<ToggleResult> RegistryMirror::SetEnabled(const std::string& key, bool enabled) {
  bool            previous = false;
  model::Snapshot published;
  {
    std::lock_guard lock(mutex_);
    auto*           record = FindLocked(key);
    if (!record) {
      throw modsync::util::NotFound(std::string(model::ToString(kind_)) + " '" + key + "' not found");
    }
    if (!model::CanTransition(record->toggle_state, ToggleState::kPending)) {
      throw modsync::util::ValidationError("a toggle for '" + key + "' is already in progress");
    }

    previous             = record->enabled;
    record->enabled      = enabled;
    record->toggle_state = ToggleState::kPending;
    inflight_[key]       = enabled;
    published            = snapshot_;
  }

  MODSYNC_LOG_DEBUG("Toggle applied locally", {StringField("key", key), BoolField("enabled", enabled)});
  Publish(published);

  auto self = shared_from_this();
  return std::async(std::launch::async, [self, key, enabled, previous] {
    return self->RunToggle(key, enabled, previous);
  });
}

ToggleResult RegistryMirror::RunToggle(const std::string& key, bool enabled, bool previous) {
  ToggleResult result;
  result.key = key;

  try {
    registry_->SetEnabled(key, modsync::registry::ToWire(kind_), game_root_, enabled);
    Settle(key, ToggleState::kConfirmed, enabled);
    result.ok      = true;
    result.enabled = enabled;
    result.state   = ToggleState::kConfirmed;
    MODSYNC_LOG_INFO("Toggle confirmed", {StringField("key", key), BoolField("enabled", enabled)});
  } catch (const std::exception& e) {
    Settle(key, ToggleState::kRolledBack, previous);
    result.enabled = previous;
    result.state   = ToggleState::kRolledBack;
    result.error   = e.what();
    MODSYNC_LOG_WARN("Toggle rejected, reverted", {StringField("key", key), BoolField("enabled", enabled), StringField("error", e.what())});
  }

  // ground truth either way
  const auto refresh = Refresh();
  if (!refresh.ok()) {
    MODSYNC_LOG_WARN("Toggle could not be verified", {StringField("key", key), StringField("error", refresh.listing_error)});
    return result;
  }

  const auto record = Find(key);
  if (!record || record->toggle_state == ToggleState::kPending) return result;

  result.verified = true;
  if (record->enabled != result.enabled) {
    result.overruled = true;
    result.enabled   = record->enabled;
    if (result.ok) {
      result.ok    = false;
      result.error = "registry kept '" + key + "' " + (record->enabled ? "enabled" : "disabled");
    }
    MODSYNC_LOG_WARN("Toggle overruled by registry listing",
                     {StringField("key", key), BoolField("requested", enabled), BoolField("enabled", record->enabled)});
  }
  return result;
}

void RegistryMirror::Settle(const std::string& key, ToggleState state, bool enabled) {
  model::Snapshot published;
  {
    std::lock_guard lock(mutex_);
    inflight_.erase(key);

    auto* record = FindLocked(key);
    if (!record || !model::CanTransition(record->toggle_state, state)) return;

    record->enabled      = enabled;
    record->toggle_state = state;
    published            = snapshot_;
  }
  Publish(published);
}

// ------------------------------------------------------------
// Remove / listeners
// ------------------------------------------------------------

RefreshResult RegistryMirror::Remove(const std::string& key) {
  if (!Find(key)) {
    throw modsync::util::NotFound(std::string(model::ToString(kind_)) + " '" + key + "' not found");
  }

  registry_->Delete(key, modsync::registry::ToWire(kind_), game_root_);
  MODSYNC_LOG_INFO("Mod removed", {StringField("key", key), StringField("kind", model::ToString(kind_))});
  return Refresh();
}

void RegistryMirror::Subscribe(Listener listener) {
  std::lock_guard lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

void RegistryMirror::Publish(const model::Snapshot& snapshot) {
  std::vector<Listener> listeners;
  {
    std::lock_guard lock(listeners_mutex_);
    listeners = listeners_;
  }

  for (const auto& listener : listeners) {
    try {
      listener(snapshot);
    } catch (const std::exception& e) {
      MODSYNC_LOG_WARN("Snapshot listener failed", {StringField("error", e.what())});
    }
  }
}

} // namespace modsync::sync
