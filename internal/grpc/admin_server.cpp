#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace market::grpc {

using namespace market::exchange::v1;

AdminServer::AdminServer(std::shared_ptr<market::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetBlockHeight(::grpc::ServerContext*, const GetBlockHeightRequest* req, GetBlockHeightResponse* resp) {
  try {
    *resp = service_->GetBlockHeight(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::AdvanceBlocks(::grpc::ServerContext*, const AdvanceBlocksRequest* req, AdvanceBlocksResponse* resp) {
  try {
    *resp = service_->AdvanceBlocks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::AuditConservation(::grpc::ServerContext*, const AuditConservationRequest* req, AuditConservationResponse* resp) {
  try {
    *resp = service_->AuditConservation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace market::grpc
