#pragma once

#include <grpcpp/channel.h>

#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/image/image_service.hpp"
#include "modsync/v1.hpp"

namespace modsync::grpc {

/*
  ImageService over gRPC. Serves both the direct read and, when the remote
  end keeps one, the encoded-copy cache.
*/
class ImageClient final : public modsync::image::ImageSource, public modsync::image::ImageCacheStore {
 public:
  ImageClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline);

  std::string ReadImage(const std::string& path) override;

  std::unordered_map<std::string, std::string> BulkRead(const std::vector<std::string>& paths) override;

  void Write(const std::string& path, const std::string& data) override;

 private:
  void PrepareUnary(::grpc::ClientContext* ctx) const;

  std::unique_ptr<modsync::v1::ImageService::Stub> stub_;
  std::chrono::milliseconds                        deadline_;
};

} // namespace modsync::grpc
