#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/mod_record.hpp"
#include "internal/sync/reconciliation_scanner.hpp"

namespace modsync::registry {
class RegistryService;
}

namespace modsync::sync {

struct RefreshResult {
  uint64_t        ticket     = 0;
  uint64_t        generation = 0;
  bool            stale      = false;
  std::string     listing_error;
  std::string     reconcile_error;
  ReconcileReport reconcile;

  bool ok() const {
    return listing_error.empty();
  }
};

/*
  Outcome of one toggle. `enabled` is the value the registry holds after
  the follow-up listing, not the requested one. `verified` is false when
  that listing failed and `enabled` is only the settled local value.
  `overruled` marks a listing that disagreed with the settled value: an
  accepted change the registry did not keep, or a reported failure it
  applied anyway.
*/
struct ToggleResult {
  std::string        key;
  bool               ok        = false;
  bool               enabled   = false;
  bool               verified  = false;
  bool               overruled = false;
  model::ToggleState state     = model::ToggleState::kPending;
  std::string        error;
};

/*
  Local read-model of the registry for one (game root, kind).

  The snapshot is replaced wholesale by Refresh(); nothing else mutates it
  except the optimistic step of SetEnabled(). Refreshes are ordered
  last-issued-wins: a result older than the newest applied one is dropped.

  Created with std::make_shared; toggles keep the mirror alive until they
  settle.
*/
class RegistryMirror : public std::enable_shared_from_this<RegistryMirror> {
 public:
  using Listener = std::function<void(const model::Snapshot&)>;

  RegistryMirror(std::shared_ptr<modsync::registry::RegistryService> registry, std::string game_root, model::ModKind kind);

  RefreshResult Refresh();
  RefreshResult Retry();

  // Message of the last failed listing; cleared by the next applied one.
  std::optional<std::string> LastError() const;

  model::Snapshot                 Current() const;
  std::optional<model::ModRecord> Find(const std::string& key) const;

  // Throws NotFound for an unknown key and ValidationError while a toggle
  // for the same key is in flight.
  std::future<ToggleResult> SetEnabled(const std::string& key, bool enabled);

  // Deletes through the registry, then refreshes. Throws NotFound for an
  // unknown key; registry errors propagate.
  RefreshResult Remove(const std::string& key);

  void Subscribe(Listener listener);

  model::ModKind kind() const {
    return kind_;
  }
  const std::string& game_root() const {
    return game_root_;
  }

 private:
  ToggleResult RunToggle(const std::string& key, bool enabled, bool previous);
  void         Settle(const std::string& key, model::ToggleState state, bool enabled);

  std::vector<model::ModRecord> FetchListing();

  model::ModRecord* FindLocked(const std::string& key);
  void              Publish(const model::Snapshot& snapshot);

  std::shared_ptr<modsync::registry::RegistryService> registry_;
  std::string                                         game_root_;
  model::ModKind                                      kind_;
  ReconciliationScanner                               scanner_;

  std::atomic<uint64_t> next_ticket_{0};

  mutable std::mutex         mutex_;
  model::Snapshot            snapshot_;
  uint64_t                   applied_ticket_ = 0;
  std::optional<std::string> last_error_;

  // key -> requested value, for toggles not yet settled
  std::unordered_map<std::string, bool> inflight_;

  std::mutex            listeners_mutex_;
  std::vector<Listener> listeners_;
};

} // namespace modsync::sync
