#include "image_client.hpp"

#include <grpcpp/client_context.h>

#include "grpc_error.hpp"

namespace modsync::grpc {

using namespace modsync::v1;

ImageClient::ImageClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(modsync::v1::ImageService::NewStub(std::move(channel))), deadline_(deadline) {
}

void ImageClient::PrepareUnary(::grpc::ClientContext* ctx) const {
  if (deadline_.count() > 0) {
    ctx->set_deadline(std::chrono::system_clock::now() + deadline_);
  }
}

std::string ImageClient::ReadImage(const std::string& path) {
  ReadImageRequest req;
  req.set_path(path);

  ReadImageResponse     resp;
  ::grpc::ClientContext ctx;
  PrepareUnary(&ctx);

  ThrowIfError(stub_->ReadImage(&ctx, req, &resp), "ReadImage");
  return std::move(*resp.mutable_data());
}

std::unordered_map<std::string, std::string> ImageClient::BulkRead(const std::vector<std::string>& paths) {
  BulkReadCachedImagesRequest req;
  for (const auto& path : paths) {
    req.add_paths(path);
  }

  BulkReadCachedImagesResponse resp;
  ::grpc::ClientContext        ctx;
  PrepareUnary(&ctx);

  ThrowIfError(stub_->BulkReadCachedImages(&ctx, req, &resp), "BulkReadCachedImages");
  return {resp.images().begin(), resp.images().end()};
}

void ImageClient::Write(const std::string& path, const std::string& data) {
  WriteCachedImageRequest req;
  req.set_path(path);
  req.set_data(data);

  google::protobuf::Empty resp;
  ::grpc::ClientContext   ctx;
  PrepareUnary(&ctx);

  ThrowIfError(stub_->WriteCachedImage(&ctx, req, &resp), "WriteCachedImage");
}

} // namespace modsync::grpc
