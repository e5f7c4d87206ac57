#include "ledger_server.hpp"

#include "grpc_error.hpp"

namespace market::grpc {

using namespace market::exchange::v1;

LedgerServer::LedgerServer(std::shared_ptr<market::service::LedgerService> svc) : service_(std::move(svc)) {
}

::grpc::Status LedgerServer::DepositFunds(::grpc::ServerContext*, const DepositFundsRequest* req, DepositFundsResponse* resp) {
  try {
    *resp = service_->DepositFunds(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::WithdrawFunds(::grpc::ServerContext*, const WithdrawFundsRequest* req, WithdrawFundsResponse* resp) {
  try {
    *resp = service_->WithdrawFunds(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetUserBalance(::grpc::ServerContext*, const GetUserBalanceRequest* req, GetUserBalanceResponse* resp) {
  try {
    *resp = service_->GetUserBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status LedgerServer::GetPlatformTreasury(::grpc::ServerContext*, const GetPlatformTreasuryRequest* req, GetPlatformTreasuryResponse* resp) {
  try {
    *resp = service_->GetPlatformTreasury(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace market::grpc
