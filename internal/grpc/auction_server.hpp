#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/auction_service.hpp"
#include "market/exchange/v1_grpc.hpp"

namespace market::grpc {

class AuctionServer final : public market::exchange::v1::AuctionService::Service {
public:
  explicit AuctionServer(std::shared_ptr<market::service::AuctionService> svc);

  ::grpc::Status CreateAuction(::grpc::ServerContext*,
                               const market::exchange::v1::CreateAuctionRequest*,
                               market::exchange::v1::CreateAuctionResponse*) override;

  ::grpc::Status PlaceBid(::grpc::ServerContext*,
                          const market::exchange::v1::PlaceBidRequest*,
                          market::exchange::v1::PlaceBidResponse*) override;

  ::grpc::Status EndAuction(::grpc::ServerContext*,
                            const market::exchange::v1::EndAuctionRequest*,
                            market::exchange::v1::EndAuctionResponse*) override;

  ::grpc::Status GetAuction(::grpc::ServerContext*,
                            const market::exchange::v1::GetAuctionRequest*,
                            market::exchange::v1::GetAuctionResponse*) override;

  ::grpc::Status IsAuctionActive(::grpc::ServerContext*,
                                 const market::exchange::v1::IsAuctionActiveRequest*,
                                 market::exchange::v1::IsAuctionActiveResponse*) override;

  ::grpc::Status ListAuctions(::grpc::ServerContext*,
                              const market::exchange::v1::ListAuctionsRequest*,
                              market::exchange::v1::ListAuctionsResponse*) override;

private:
  std::shared_ptr<market::service::AuctionService> service_;
};

}
