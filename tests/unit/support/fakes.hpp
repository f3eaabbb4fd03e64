#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/image/image_service.hpp"
#include "internal/registry/registry_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/path_utils.hpp"

namespace modsync::testing {

inline modsync::v1::ModEntry MakeMod(const std::string& directory_name, bool enabled, const std::string& thumbnail = "") {
  modsync::v1::ModEntry entry;
  auto*                 fields = entry.mutable_fields();
  fields->set_name(directory_name);
  fields->set_directory_name(directory_name);
  fields->set_path("/game/reframework/" + directory_name);
  fields->set_enabled(enabled);
  fields->set_mod_type(modsync::v1::MOD_TYPE_REFRAMEWORK_PLUGIN);
  entry.set_thumbnail_path(thumbnail);
  return entry;
}

inline modsync::v1::SkinModEntry MakeSkin(const std::string& path, bool enabled) {
  modsync::v1::SkinModEntry entry;
  entry.set_path(path);
  entry.set_name(modsync::util::FileName(path));
  entry.set_enabled(enabled);
  return entry;
}

/*
  In-memory registry. Listings are served from `mods` / `skins`; installs
  append a mod named after the archive unless the archive is in
  `corrupt_archives`.
*/
class FakeRegistry final : public modsync::registry::RegistryService {
 public:
  modsync::v1::RescanResponse Rescan(const std::string&, modsync::v1::ModKind) override {
    ++rescan_calls;
    if (fail_rescan) throw modsync::util::TransportError("rescan: registry unreachable");

    modsync::v1::RescanResponse resp;
    resp.set_discovered(1);
    return resp;
  }

  std::vector<modsync::v1::ModEntry> ListMods(const std::string&) override {
    const int call = ++list_calls;
    if (before_list) before_list(call);
    if (fail_listing) throw modsync::util::TransportError("list mods: registry unreachable");

    std::lock_guard lock(mutex);
    return mods;
  }

  std::vector<modsync::v1::SkinModEntry> ListSkins(const std::string&) override {
    ++list_calls;
    if (fail_listing) throw modsync::util::TransportError("list skins: registry unreachable");

    std::lock_guard lock(mutex);
    return skins;
  }

  void InstallFromArchive(const std::string& archive_path, const std::string&, const InstallEventCallback& on_event) override {
    ++install_calls;

    modsync::v1::InstallEvent event;
    event.set_archive_path(archive_path);
    event.set_stage("extracting");
    if (on_event) on_event(event);

    if (corrupt_archives.count(archive_path) > 0) {
      throw modsync::util::ValidationError("archive has no recognizable mod layout");
    }

    std::lock_guard lock(mutex);
    mods.push_back(MakeMod(modsync::util::FileName(archive_path), true));
  }

  void SetEnabled(const std::string& key, modsync::v1::ModKind kind, const std::string&, bool enabled) override {
    ++set_enabled_calls;
    if (before_set_enabled) before_set_enabled();
    if (reject_toggle) throw modsync::util::ValidationError("registry refused toggle for " + key);

    std::lock_guard lock(mutex);
    if (kind == modsync::v1::MOD_KIND_SKIN) {
      for (auto& skin : skins) {
        if (skin.path() == key) skin.set_enabled(enabled);
      }
      return;
    }
    for (auto& mod : mods) {
      if (mod.fields().directory_name() == key) mod.mutable_fields()->set_enabled(enabled);
    }
  }

  void Delete(const std::string& key, modsync::v1::ModKind, const std::string&) override {
    ++delete_calls;

    std::lock_guard lock(mutex);
    for (auto it = mods.begin(); it != mods.end(); ++it) {
      if (it->fields().directory_name() == key) {
        mods.erase(it);
        return;
      }
    }
    throw modsync::util::NotFound("no mod " + key);
  }

  std::mutex                             mutex;
  std::vector<modsync::v1::ModEntry>     mods;
  std::vector<modsync::v1::SkinModEntry> skins;
  std::set<std::string>                  corrupt_archives;

  std::atomic<bool> fail_rescan{false};
  std::atomic<bool> fail_listing{false};
  std::atomic<bool> reject_toggle{false};

  std::function<void(int)> before_list;
  std::function<void()>    before_set_enabled;

  std::atomic<int> rescan_calls{0};
  std::atomic<int> list_calls{0};
  std::atomic<int> install_calls{0};
  std::atomic<int> set_enabled_calls{0};
  std::atomic<int> delete_calls{0};
};

class FakeImageSource final : public modsync::image::ImageSource {
 public:
  std::string ReadImage(const std::string& path) override {
    std::lock_guard lock(mutex);
    ++reads[path];
    if (broken.count(path) > 0) throw modsync::util::TransportError("cannot decode " + path);

    auto it = images.find(path);
    if (it == images.end()) throw modsync::util::NotFound("no image at " + path);
    return it->second;
  }

  int Reads(const std::string& path) {
    std::lock_guard lock(mutex);
    return reads[path];
  }

  std::mutex                         mutex;
  std::map<std::string, std::string> images;
  std::set<std::string>              broken;
  std::map<std::string, int>         reads;
};

class FakeImageStore final : public modsync::image::ImageCacheStore {
 public:
  std::unordered_map<std::string, std::string> BulkRead(const std::vector<std::string>& paths) override {
    ++bulk_calls;
    if (unavailable) throw modsync::util::CapabilityUnavailable("bulk read not offered");
    if (failing) throw modsync::util::TransportError("cache backend down");

    std::lock_guard                              lock(mutex);
    std::unordered_map<std::string, std::string> hits;
    for (const auto& path : paths) {
      auto it = entries.find(path);
      if (it != entries.end()) hits.emplace(path, it->second);
    }
    return hits;
  }

  void Write(const std::string& path, const std::string& data) override {
    if (failing) throw modsync::util::TransportError("cache backend down");

    std::lock_guard lock(mutex);
    entries[path] = data;
  }

  bool Has(const std::string& path) {
    std::lock_guard lock(mutex);
    return entries.count(path) > 0;
  }

  std::mutex                         mutex;
  std::map<std::string, std::string> entries;

  std::atomic<bool> unavailable{false};
  std::atomic<bool> failing{false};
  std::atomic<int>  bulk_calls{0};
};

} // namespace modsync::testing
