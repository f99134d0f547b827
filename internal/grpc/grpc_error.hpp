#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace trackq::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace trackq::grpc
