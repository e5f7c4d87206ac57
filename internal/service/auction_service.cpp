#include "auction_service.hpp"

#include "internal/core/marketplace.hpp"
#include "observe_rpc.hpp"

namespace market::service {

using namespace market::exchange::v1;
using detail::ObserveRpc;

AuctionService::AuctionService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateAuctionResponse AuctionService::CreateAuction(const CreateAuctionRequest& req) {
  return ObserveRpc("AuctionService.CreateAuction", req.sender(), [&] {
    detail::RequireSender(req.sender());
    const auto auction = ctx_.marketplace->CreateAuction(req.sender(), req.requirements(), req.max_duration(), req.starting_price());

    CreateAuctionResponse resp;
    resp.set_auction_id(auction.id());
    resp.set_end_height(auction.end_height());
    return resp;
  });
}

PlaceBidResponse AuctionService::PlaceBid(const PlaceBidRequest& req) {
  return ObserveRpc("AuctionService.PlaceBid", req.sender(), [&] {
    detail::RequireSender(req.sender());
    PlaceBidResponse resp;
    *resp.mutable_auction() = ctx_.marketplace->PlaceBid(req.sender(), req.auction_id(), req.amount());
    return resp;
  });
}

EndAuctionResponse AuctionService::EndAuction(const EndAuctionRequest& req) {
  return ObserveRpc("AuctionService.EndAuction", req.sender(), [&] {
    detail::RequireSender(req.sender());
    EndAuctionResponse resp;
    resp.set_job_id(ctx_.marketplace->EndAuction(req.sender(), req.auction_id()));
    return resp;
  });
}

GetAuctionResponse AuctionService::GetAuction(const GetAuctionRequest& req) {
  return ObserveRpc("AuctionService.GetAuction", "", [&] {
    GetAuctionResponse resp;
    *resp.mutable_auction() = ctx_.marketplace->GetAuction(req.auction_id());
    return resp;
  });
}

IsAuctionActiveResponse AuctionService::IsAuctionActive(const IsAuctionActiveRequest& req) {
  return ObserveRpc("AuctionService.IsAuctionActive", "", [&] {
    IsAuctionActiveResponse resp;
    resp.set_active(ctx_.marketplace->IsAuctionActive(req.auction_id()));
    return resp;
  });
}

ListAuctionsResponse AuctionService::ListAuctions(const ListAuctionsRequest& req) {
  return ObserveRpc("AuctionService.ListAuctions", "", [&] {
    ListAuctionsResponse resp;
    for (auto& auction : ctx_.marketplace->ListAuctions(req.active_only(), detail::ToPagination(req.page()))) {
      *resp.add_auctions() = std::move(auction);
    }
    return resp;
  });
}

} // namespace market::service
