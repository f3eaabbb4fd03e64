#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "internal/cache/thumbnail_cache.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/mod_context.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using modsync::model::ModRecord;
using modsync::sync::RegistryMirror;

static void Usage() {
  std::cout << "Usage:\n"
            << "  modsyncctl <config.yaml> mods\n"
            << "  modsyncctl <config.yaml> skins\n"
            << "  modsyncctl <config.yaml> install <archive.zip>...\n"
            << "  modsyncctl <config.yaml> enable <directory_name>\n"
            << "  modsyncctl <config.yaml> disable <directory_name>\n"
            << "  modsyncctl <config.yaml> enable-skin <path>\n"
            << "  modsyncctl <config.yaml> disable-skin <path>\n"
            << "  modsyncctl <config.yaml> delete <directory_name>\n"
            << "  modsyncctl <config.yaml> thumbnails <image_path>...\n";
}

static void PrintRecord(const ModRecord& record) {
  std::cout << (record.enabled ? "[x] " : "[ ] ") << record.key << "  " << record.name;
  if (record.version) std::cout << " " << *record.version;
  if (record.author) std::cout << " by " << *record.author;
  if (record.toggle_state != modsync::model::ToggleState::kSynced) {
    std::cout << " (" << modsync::model::ToString(record.toggle_state) << ")";
  }
  std::cout << "\n";
  for (const auto& conflict : record.conflicts) {
    std::cout << "    conflicts with " << conflict << "\n";
  }
}

static int List(RegistryMirror& mirror) {
  const auto result = mirror.Refresh();
  if (!result.reconcile_error.empty()) {
    std::cerr << "reconciliation failed: " << result.reconcile_error << "\n";
  }
  if (!result.ok()) {
    std::cerr << result.listing_error << "\n";
    return 2;
  }

  for (const auto& record : mirror.Current().records) {
    PrintRecord(record);
  }
  return 0;
}

static int Toggle(RegistryMirror& mirror, const std::string& key, bool enabled) {
  const auto refresh = mirror.Refresh();
  if (!refresh.ok()) {
    std::cerr << refresh.listing_error << "\n";
    return 2;
  }

  const auto result = mirror.SetEnabled(key, enabled).get();
  if (!result.ok) {
    std::cerr << result.error << "\n";
  }
  if (!result.verified) {
    std::cerr << "state of " << key << " could not be confirmed\n";
  }

  std::cout << key << (result.enabled ? " enabled" : " disabled") << "\n";
  return result.ok && result.verified ? 0 : 2;
}

static int Install(modsync::core::ModContext& ctx, const std::vector<std::string>& archives) {
  ctx.installer().AddObserver([](const modsync::v1::InstallEvent& event) {
    std::cout << event.archive_path() << ": " << event.stage();
    if (event.bytes_total() > 0) std::cout << " " << event.bytes_done() << "/" << event.bytes_total();
    std::cout << "\n";
  });

  const auto result = ctx.installer().InstallBatch(archives);

  int rc = 0;
  for (const auto& outcome : result.outcomes) {
    if (outcome.ok) {
      std::cout << "installed " << outcome.archive_path << "\n";
    } else {
      std::cerr << outcome.error << "\n";
      rc = 2;
    }
  }
  if (result.refresh && !result.refresh->ok()) {
    std::cerr << "mod list not refreshed: " << result.refresh->listing_error << "\n";
    rc = 2;
  }
  return rc;
}

static int Thumbnails(modsync::core::ModContext& ctx, const std::set<std::string>& paths) {
  const auto resolved = ctx.ResolveThumbnails(paths);
  for (const auto& path : paths) {
    auto it = resolved.find(path);
    if (it == resolved.end()) {
      std::cout << path << ": placeholder\n";
    } else {
      std::cout << path << ": " << it->second.size() << " bytes\n";
    }
  }

  const auto stats = ctx.thumbnails().GetStats();
  MODSYNC_LOG_DEBUG("Thumbnail tiers", {modsync::observability::IntField("warm", static_cast<std::int64_t>(stats.warm_hits)),
                                        modsync::observability::IntField("session", static_cast<std::int64_t>(stats.session_hits)),
                                        modsync::observability::IntField("bulk", static_cast<std::int64_t>(stats.bulk_hits)),
                                        modsync::observability::IntField("direct", static_cast<std::int64_t>(stats.direct_reads))});
  return 0;
}

static int Run(modsync::core::ModContext& ctx, const std::string& cmd, const std::vector<std::string>& args) {
  if (cmd == "mods") return List(ctx.mods());
  if (cmd == "skins") return List(ctx.skins());

  if (args.empty()) {
    Usage();
    return 1;
  }

  if (cmd == "install") return Install(ctx, args);
  if (cmd == "enable") return Toggle(ctx.mods(), args[0], true);
  if (cmd == "disable") return Toggle(ctx.mods(), args[0], false);
  if (cmd == "enable-skin") return Toggle(ctx.skins(), args[0], true);
  if (cmd == "disable-skin") return Toggle(ctx.skins(), args[0], false);

  if (cmd == "delete") {
    const auto refresh = ctx.mods().Refresh();
    if (!refresh.ok()) {
      std::cerr << refresh.listing_error << "\n";
      return 2;
    }
    ctx.mods().Remove(args[0]);
    std::cout << "deleted " << args[0] << "\n";
    return 0;
  }

  if (cmd == "thumbnails") return Thumbnails(ctx, std::set<std::string>(args.begin(), args.end()));

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string        config_path = argv[1];
  const std::string        cmd         = argv[2];
  std::vector<std::string> args(argv + 3, argv + argc);

  modsync::runtime::config::RuntimeConfig config;
  try {
    config = modsync::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const std::exception& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  modsync::observability::InitializeLogging(config);

  int rc = 0;
  try {
    auto app = modsync::factory::Build(config);
    rc       = Run(*app.context, cmd, args);
  } catch (const std::exception& e) {
    MODSYNC_LOG_ERROR("Command failed", {modsync::observability::StringField("command", cmd), modsync::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    rc = 2;
  }

  modsync::observability::ShutdownLogging();
  return rc;
}
