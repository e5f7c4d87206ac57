#include "admin_service.hpp"

#include "internal/chain/block_clock.hpp"
#include "internal/core/marketplace.hpp"
#include "observe_rpc.hpp"

namespace market::service {

using namespace market::exchange::v1;
using detail::ObserveRpc;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", "", [&] { return ctx_.marketplace->Stats(); });
}

GetBlockHeightResponse AdminService::GetBlockHeight(const GetBlockHeightRequest&) {
  return ObserveRpc("AdminService.GetBlockHeight", "", [&] {
    GetBlockHeightResponse resp;
    resp.set_height(ctx_.marketplace->BlockHeight());
    return resp;
  });
}

AdvanceBlocksResponse AdminService::AdvanceBlocks(const AdvanceBlocksRequest& req) {
  return ObserveRpc("AdminService.AdvanceBlocks", "", [&] {
    if (!ctx_.manual_clock) {
      throw market::util::InvalidState("advance blocks: the block clock is not manual");
    }

    AdvanceBlocksResponse resp;
    resp.set_height(ctx_.manual_clock->Advance(req.blocks()));
    MARKET_LOG_INFO("Blocks advanced", {market::observability::TokenField("blocks", req.blocks()),
                                        market::observability::TokenField("height", resp.height())});
    return resp;
  });
}

AuditConservationResponse AdminService::AuditConservation(const AuditConservationRequest&) {
  return ObserveRpc("AdminService.AuditConservation", "", [&] { return ctx_.marketplace->AuditConservation(); });
}

} // namespace market::service
