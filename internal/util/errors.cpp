#include "errors.hpp"

namespace market::util {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotAuthorized:
      return "NOT_AUTHORIZED";
    case ErrorCode::ResourceNotFound:
      return "RESOURCE_NOT_FOUND";
    case ErrorCode::AuctionNotFound:
      return "AUCTION_NOT_FOUND";
    case ErrorCode::AuctionEnded:
      return "AUCTION_ENDED";
    case ErrorCode::AuctionActive:
      return "AUCTION_ACTIVE";
    case ErrorCode::BidTooLow:
      return "BID_TOO_LOW";
    case ErrorCode::InsufficientBalance:
      return "INSUFFICIENT_BALANCE";
    case ErrorCode::JobNotFound:
      return "JOB_NOT_FOUND";
    case ErrorCode::InvalidProof:
      return "INVALID_PROOF";
    case ErrorCode::MilestoneNotReady:
      return "MILESTONE_NOT_READY";
    case ErrorCode::AlreadyCompleted:
      return "ALREADY_COMPLETED";
    case ErrorCode::TransferFailed:
      return "TRANSFER_FAILED";
    case ErrorCode::Unsupported:
      return "UNSUPPORTED";
  }
  return "UNKNOWN";
}

} // namespace market::util
