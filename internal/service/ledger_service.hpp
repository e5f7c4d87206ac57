#pragma once

#include "market/exchange/v1.hpp"
#include "service_context.hpp"

namespace market::service {

class LedgerService {
public:
  explicit LedgerService(ServiceContext ctx);

  market::exchange::v1::DepositFundsResponse
  DepositFunds(const market::exchange::v1::DepositFundsRequest& req);

  market::exchange::v1::WithdrawFundsResponse
  WithdrawFunds(const market::exchange::v1::WithdrawFundsRequest& req);

  market::exchange::v1::GetUserBalanceResponse
  GetUserBalance(const market::exchange::v1::GetUserBalanceRequest& req);

  market::exchange::v1::GetPlatformTreasuryResponse
  GetPlatformTreasury(const market::exchange::v1::GetPlatformTreasuryRequest& req);

private:
  ServiceContext ctx_;
};

}
