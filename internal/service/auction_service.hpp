#pragma once

#include "market/exchange/v1.hpp"
#include "service_context.hpp"

namespace market::service {

class AuctionService {
public:
  explicit AuctionService(ServiceContext ctx);

  market::exchange::v1::CreateAuctionResponse
  CreateAuction(const market::exchange::v1::CreateAuctionRequest& req);

  market::exchange::v1::PlaceBidResponse
  PlaceBid(const market::exchange::v1::PlaceBidRequest& req);

  market::exchange::v1::EndAuctionResponse
  EndAuction(const market::exchange::v1::EndAuctionRequest& req);

  market::exchange::v1::GetAuctionResponse
  GetAuction(const market::exchange::v1::GetAuctionRequest& req);

  market::exchange::v1::IsAuctionActiveResponse
  IsAuctionActive(const market::exchange::v1::IsAuctionActiveRequest& req);

  market::exchange::v1::ListAuctionsResponse
  ListAuctions(const market::exchange::v1::ListAuctionsRequest& req);

private:
  ServiceContext ctx_;
};

}
