#include <cassert>
#include <iostream>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/grpc_error.hpp"
#include "internal/util/errors.hpp"

namespace {

template <typename Error>
std::string ExpectThrows(::grpc::StatusCode code, const std::string& message) {
  try {
    modsync::grpc::ThrowIfError(::grpc::Status(code, message), "install from archive");
  } catch (const Error& e) {
    return e.what();
  }
  assert(false && "expected ThrowIfError to throw");
  return {};
}

void TestOkStatusDoesNotThrow() {
  modsync::grpc::ThrowIfError(::grpc::Status::OK, "list mods");
}

void TestNotFoundMapsToNotFound() {
  const auto what = ExpectThrows<modsync::util::NotFound>(::grpc::StatusCode::NOT_FOUND, "no mod FreeCam");
  assert(what == "no mod FreeCam");
}

void TestRejectionsMapToValidationErrorVerbatim() {
  assert(ExpectThrows<modsync::util::ValidationError>(::grpc::StatusCode::INVALID_ARGUMENT, "manifest missing") == "manifest missing");
  assert(ExpectThrows<modsync::util::ValidationError>(::grpc::StatusCode::FAILED_PRECONDITION, "game running") == "game running");
  assert(ExpectThrows<modsync::util::ValidationError>(::grpc::StatusCode::ALREADY_EXISTS, "already installed") == "already installed");
}

void TestUnimplementedMapsToCapabilityUnavailable() {
  (void)ExpectThrows<modsync::util::CapabilityUnavailable>(::grpc::StatusCode::UNIMPLEMENTED, "");
}

void TestTransportFailuresCarryTheAction() {
  const auto what = ExpectThrows<modsync::util::TransportError>(::grpc::StatusCode::UNAVAILABLE, "connection refused");
  assert(what == "install from archive failed: connection refused");

  const auto other = ExpectThrows<modsync::util::TransportError>(::grpc::StatusCode::PERMISSION_DENIED, "archive not readable");
  assert(other == "archive not readable");
}

} // namespace

int main() {
  TestOkStatusDoesNotThrow();
  TestNotFoundMapsToNotFound();
  TestRejectionsMapToValidationErrorVerbatim();
  TestUnimplementedMapsToCapabilityUnavailable();
  TestTransportFailuresCarryTheAction();

  std::cout << "modsync_unit_grpc_status: pass\n";
  return 0;
}
