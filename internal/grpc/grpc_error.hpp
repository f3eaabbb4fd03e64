#pragma once

#include <grpcpp/grpcpp.h>

#include <string_view>

#include "internal/util/errors.hpp"

namespace modsync::grpc {

/*
  Converts gRPC status codes returned by the registry and image services
  into internal exceptions.
*/

void ThrowIfError(const ::grpc::Status& status, std::string_view action);

} // namespace modsync::grpc
