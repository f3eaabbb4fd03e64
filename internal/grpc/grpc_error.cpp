#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace modsync::grpc {

void ThrowIfError(const ::grpc::Status& status, std::string_view action) {
  using namespace modsync::util;

  if (status.ok()) {
    return;
  }

  // Service messages pass through verbatim; transport failures get the
  // action prefix.
  const std::string& message = status.error_message();

  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      throw NotFound(message);
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
    case ::grpc::StatusCode::ALREADY_EXISTS:
      throw ValidationError(message);
    case ::grpc::StatusCode::UNIMPLEMENTED:
      throw CapabilityUnavailable(std::string(action) + " is not supported by the remote service");
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      throw TransportError(std::string(action) + " failed: " + message);
    default:
      throw TransportError(message.empty() ? std::string(action) + " failed" : message);
  }
}

} // namespace modsync::grpc
