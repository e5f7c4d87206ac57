#include "auction_server.hpp"

#include "grpc_error.hpp"

namespace market::grpc {

using namespace market::exchange::v1;

AuctionServer::AuctionServer(std::shared_ptr<market::service::AuctionService> svc) : service_(std::move(svc)) {
}

::grpc::Status AuctionServer::CreateAuction(::grpc::ServerContext*, const CreateAuctionRequest* req, CreateAuctionResponse* resp) {
  try {
    *resp = service_->CreateAuction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::PlaceBid(::grpc::ServerContext*, const PlaceBidRequest* req, PlaceBidResponse* resp) {
  try {
    *resp = service_->PlaceBid(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::EndAuction(::grpc::ServerContext*, const EndAuctionRequest* req, EndAuctionResponse* resp) {
  try {
    *resp = service_->EndAuction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::GetAuction(::grpc::ServerContext*, const GetAuctionRequest* req, GetAuctionResponse* resp) {
  try {
    *resp = service_->GetAuction(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::IsAuctionActive(::grpc::ServerContext*, const IsAuctionActiveRequest* req, IsAuctionActiveResponse* resp) {
  try {
    *resp = service_->IsAuctionActive(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AuctionServer::ListAuctions(::grpc::ServerContext*, const ListAuctionsRequest* req, ListAuctionsResponse* resp) {
  try {
    *resp = service_->ListAuctions(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace market::grpc
