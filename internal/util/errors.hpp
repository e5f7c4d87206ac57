#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace market::util {

/*
  Central error types.

  MarketError subclasses are the business failures every operation can
  report; they get translated later to gRPC status codes. A failing
  operation never commits, so raising one of these is the whole rollback.
*/

enum class ErrorCode {
  NotAuthorized,
  ResourceNotFound,
  AuctionNotFound,
  AuctionEnded,
  AuctionActive,
  BidTooLow,
  InsufficientBalance,
  JobNotFound,
  InvalidProof,
  MilestoneNotReady,
  AlreadyCompleted,
  TransferFailed,
  Unsupported,
};

std::string_view ErrorCodeName(ErrorCode code);

class MarketError : public std::runtime_error {
 public:
  MarketError(ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  ErrorCode code() const noexcept {
    return code_;
  }

 private:
  ErrorCode code_;
};

#define MARKET_DEFINE_ERROR(Name)                                                   \
  class Name : public MarketError {                                                \
   public:                                                                         \
    explicit Name(const std::string& msg) : MarketError(ErrorCode::Name, msg) {    \
    }                                                                              \
  }

MARKET_DEFINE_ERROR(NotAuthorized);
MARKET_DEFINE_ERROR(ResourceNotFound);
MARKET_DEFINE_ERROR(AuctionNotFound);
MARKET_DEFINE_ERROR(AuctionEnded);
MARKET_DEFINE_ERROR(AuctionActive);
MARKET_DEFINE_ERROR(BidTooLow);
MARKET_DEFINE_ERROR(InsufficientBalance);
MARKET_DEFINE_ERROR(JobNotFound);
MARKET_DEFINE_ERROR(InvalidProof);
MARKET_DEFINE_ERROR(MilestoneNotReady);
MARKET_DEFINE_ERROR(AlreadyCompleted);
MARKET_DEFINE_ERROR(TransferFailed);
MARKET_DEFINE_ERROR(Unsupported);

#undef MARKET_DEFINE_ERROR

// Storage-level failures surfaced from the repository layer.

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace market::util
