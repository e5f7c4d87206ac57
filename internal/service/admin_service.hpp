#pragma once

#include "market/exchange/v1.hpp"
#include "service_context.hpp"

namespace market::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  market::exchange::v1::StatsResponse
  Stats(const market::exchange::v1::StatsRequest& req);

  market::exchange::v1::GetBlockHeightResponse
  GetBlockHeight(const market::exchange::v1::GetBlockHeightRequest& req);

  // Only available with a manual block clock.
  market::exchange::v1::AdvanceBlocksResponse
  AdvanceBlocks(const market::exchange::v1::AdvanceBlocksRequest& req);

  market::exchange::v1::AuditConservationResponse
  AuditConservation(const market::exchange::v1::AuditConservationRequest& req);

private:
  ServiceContext ctx_;
};

}
