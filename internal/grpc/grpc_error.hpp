#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace keyshop::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Storage faults map to UNAVAILABLE so payment providers redeliver.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace keyshop::grpc
