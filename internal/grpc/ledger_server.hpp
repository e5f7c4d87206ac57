#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/ledger_service.hpp"
#include "market/exchange/v1_grpc.hpp"

namespace market::grpc {

class LedgerServer final : public market::exchange::v1::LedgerService::Service {
public:
  explicit LedgerServer(std::shared_ptr<market::service::LedgerService> svc);

  ::grpc::Status DepositFunds(::grpc::ServerContext*,
                              const market::exchange::v1::DepositFundsRequest*,
                              market::exchange::v1::DepositFundsResponse*) override;

  ::grpc::Status WithdrawFunds(::grpc::ServerContext*,
                               const market::exchange::v1::WithdrawFundsRequest*,
                               market::exchange::v1::WithdrawFundsResponse*) override;

  ::grpc::Status GetUserBalance(::grpc::ServerContext*,
                                const market::exchange::v1::GetUserBalanceRequest*,
                                market::exchange::v1::GetUserBalanceResponse*) override;

  ::grpc::Status GetPlatformTreasury(::grpc::ServerContext*,
                                     const market::exchange::v1::GetPlatformTreasuryRequest*,
                                     market::exchange::v1::GetPlatformTreasuryResponse*) override;

private:
  std::shared_ptr<market::service::LedgerService> service_;
};

}
