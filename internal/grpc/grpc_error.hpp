#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace market::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  MarketError codes travel in error_details as their stable name
  (e.g. "BID_TOO_LOW") so clients can branch without parsing messages.
*/

::grpc::StatusCode StatusCodeFor(market::util::ErrorCode code);

::grpc::Status ToStatus(const std::exception& e);

} // namespace market::grpc
