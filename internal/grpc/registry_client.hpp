#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/registry/registry_service.hpp"
#include "modsync/v1.hpp"

namespace modsync::grpc {

/*
  RegistryService over gRPC.

  Unary calls carry a deadline; InstallFromArchive does not, since
  extraction time grows with archive size.
*/
class RegistryClient final : public modsync::registry::RegistryService {
 public:
  RegistryClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline);

  modsync::v1::RescanResponse Rescan(const std::string& game_root, modsync::v1::ModKind kind) override;

  std::vector<modsync::v1::ModEntry>     ListMods(const std::string& game_root) override;
  std::vector<modsync::v1::SkinModEntry> ListSkins(const std::string& game_root) override;

  void InstallFromArchive(const std::string& archive_path, const std::string& game_root, const InstallEventCallback& on_event) override;

  void SetEnabled(const std::string& key, modsync::v1::ModKind kind, const std::string& game_root, bool enabled) override;

  void Delete(const std::string& key, modsync::v1::ModKind kind, const std::string& game_root) override;

 private:
  void PrepareUnary(::grpc::ClientContext* ctx) const;

  std::unique_ptr<modsync::v1::RegistryService::Stub> stub_;
  std::chrono::milliseconds                           deadline_;
};

} // namespace modsync::grpc
