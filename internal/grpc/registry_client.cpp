#include "registry_client.hpp"

#include <grpcpp/client_context.h>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace modsync::grpc {

using namespace modsync::v1;

RegistryClient::RegistryClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(modsync::v1::RegistryService::NewStub(std::move(channel))), deadline_(deadline) {
}

void RegistryClient::PrepareUnary(::grpc::ClientContext* ctx) const {
  if (deadline_.count() > 0) {
    ctx->set_deadline(std::chrono::system_clock::now() + deadline_);
  }
}

RescanResponse RegistryClient::Rescan(const std::string& game_root, ModKind kind) {
  RescanRequest req;
  req.set_game_root(game_root);
  req.set_kind(kind);

  RescanResponse        resp;
  ::grpc::ClientContext ctx;
  PrepareUnary(&ctx);

  ThrowIfError(stub_->Rescan(&ctx, req, &resp), "Rescan");
  return resp;
}

std::vector<ModEntry> RegistryClient::ListMods(const std::string& game_root) {
  ListModsRequest req;
  req.set_game_root(game_root);

  ListModsResponse      resp;
  ::grpc::ClientContext ctx;
  PrepareUnary(&ctx);

  ThrowIfError(stub_->ListMods(&ctx, req, &resp), "ListMods");
  return {resp.mods().begin(), resp.mods().end()};
}

std::vector<SkinModEntry> RegistryClient::ListSkins(const std::string& game_root) {
  ListSkinsRequest req;
  req.set_game_root(game_root);

  ListSkinsResponse     resp;
  ::grpc::ClientContext ctx;
  PrepareUnary(&ctx);

  ThrowIfError(stub_->ListSkins(&ctx, req, &resp), "ListSkins");
  return {resp.skins().begin(), resp.skins().end()};
}

void RegistryClient::InstallFromArchive(const std::string& archive_path, const std::string& game_root, const InstallEventCallback& on_event) {
  InstallFromArchiveRequest req;
  req.set_archive_path(archive_path);
  req.set_game_root(game_root);

  ::grpc::ClientContext ctx;
  auto                  reader = stub_->InstallFromArchive(&ctx, req);

  InstallEvent event;
  while (reader->Read(&event)) {
    if (on_event) {
      on_event(event);
    }
  }

  ThrowIfError(reader->Finish(), "InstallFromArchive");
}

void RegistryClient::SetEnabled(const std::string& key, ModKind kind, const std::string& game_root, bool enabled) {
  SetEnabledRequest req;
  req.set_key(key);
  req.set_kind(kind);
  req.set_game_root(game_root);
  req.set_enabled(enabled);

  google::protobuf::Empty resp;
  ::grpc::ClientContext   ctx;
  PrepareUnary(&ctx);

  ThrowIfError(stub_->SetEnabled(&ctx, req, &resp), "SetEnabled");
}

void RegistryClient::Delete(const std::string& key, ModKind kind, const std::string& game_root) {
  DeleteModRequest req;
  req.set_key(key);
  req.set_kind(kind);
  req.set_game_root(game_root);

  google::protobuf::Empty resp;
  ::grpc::ClientContext   ctx;
  PrepareUnary(&ctx);

  ThrowIfError(stub_->DeleteMod(&ctx, req, &resp), "DeleteMod");
  MODSYNC_LOG_INFO("Mod deleted", {modsync::observability::StringField("key", key)});
}

} // namespace modsync::grpc
