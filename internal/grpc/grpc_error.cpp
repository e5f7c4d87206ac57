#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace market::grpc {

::grpc::StatusCode StatusCodeFor(market::util::ErrorCode code) {
  using market::util::ErrorCode;

  switch (code) {
    case ErrorCode::NotAuthorized:
      return ::grpc::StatusCode::PERMISSION_DENIED;
    case ErrorCode::ResourceNotFound:
    case ErrorCode::AuctionNotFound:
    case ErrorCode::JobNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case ErrorCode::AuctionEnded:
    case ErrorCode::AuctionActive:
    case ErrorCode::MilestoneNotReady:
    case ErrorCode::AlreadyCompleted:
    case ErrorCode::InsufficientBalance:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case ErrorCode::BidTooLow:
    case ErrorCode::InvalidProof:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case ErrorCode::TransferFailed:
      return ::grpc::StatusCode::ABORTED;
    case ErrorCode::Unsupported:
      return ::grpc::StatusCode::UNIMPLEMENTED;
  }
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::Status ToStatus(const std::exception& e) {
  using namespace market::util;

  if (const auto* market_error = dynamic_cast<const MarketError*>(&e)) {
    return {StatusCodeFor(market_error->code()), e.what(), std::string(ErrorCodeName(market_error->code()))};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace market::grpc
