#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/admin_service.hpp"
#include "market/exchange/v1_grpc.hpp"

namespace market::grpc {

class AdminServer final : public market::exchange::v1::MarketAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<market::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*,
                       const market::exchange::v1::StatsRequest*,
                       market::exchange::v1::StatsResponse*) override;

  ::grpc::Status GetBlockHeight(::grpc::ServerContext*,
                                const market::exchange::v1::GetBlockHeightRequest*,
                                market::exchange::v1::GetBlockHeightResponse*) override;

  ::grpc::Status AdvanceBlocks(::grpc::ServerContext*,
                               const market::exchange::v1::AdvanceBlocksRequest*,
                               market::exchange::v1::AdvanceBlocksResponse*) override;

  ::grpc::Status AuditConservation(::grpc::ServerContext*,
                                   const market::exchange::v1::AuditConservationRequest*,
                                   market::exchange::v1::AuditConservationResponse*) override;

private:
  std::shared_ptr<market::service::AdminService> service_;
};

}
