#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace proxicloud::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    ValidationError    -> INVALID_ARGUMENT
    Conflict           -> ABORTED
    NotFound           -> NOT_FOUND
    ProvisioningError  -> UNAVAILABLE
    anything else      -> INTERNAL
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace proxicloud::grpc
