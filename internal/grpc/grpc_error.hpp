#pragma once

#include <grpcpp/grpcpp.h>

#include "bay/v1/types.pb.h"
#include "internal/util/errors.hpp"

namespace bay::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  The status details carry a serialized bay.v1.ErrorInfo with the stable
  error code, so clients never parse messages.
*/

::grpc::Status ToStatus(const std::exception& e);

bay::v1::ErrorInfo ToErrorInfo(const std::exception& e);

} // namespace bay::grpc
