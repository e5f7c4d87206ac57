#include "ledger_service.hpp"

#include "internal/core/marketplace.hpp"
#include "observe_rpc.hpp"

namespace market::service {

using namespace market::exchange::v1;
using detail::ObserveRpc;

LedgerService::LedgerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

DepositFundsResponse LedgerService::DepositFunds(const DepositFundsRequest& req) {
  return ObserveRpc("LedgerService.DepositFunds", req.sender(), [&] {
    detail::RequireSender(req.sender());
    DepositFundsResponse resp;
    resp.set_balance(ctx_.marketplace->DepositFunds(req.sender(), req.amount()));
    return resp;
  });
}

WithdrawFundsResponse LedgerService::WithdrawFunds(const WithdrawFundsRequest& req) {
  return ObserveRpc("LedgerService.WithdrawFunds", req.sender(), [&] {
    detail::RequireSender(req.sender());
    WithdrawFundsResponse resp;
    resp.set_balance(ctx_.marketplace->WithdrawFunds(req.sender(), req.amount()));
    return resp;
  });
}

GetUserBalanceResponse LedgerService::GetUserBalance(const GetUserBalanceRequest& req) {
  return ObserveRpc("LedgerService.GetUserBalance", req.principal(), [&] {
    GetUserBalanceResponse resp;
    resp.set_balance(ctx_.marketplace->GetUserBalance(req.principal()));
    return resp;
  });
}

GetPlatformTreasuryResponse LedgerService::GetPlatformTreasury(const GetPlatformTreasuryRequest&) {
  return ObserveRpc("LedgerService.GetPlatformTreasury", "", [&] {
    GetPlatformTreasuryResponse resp;
    resp.set_treasury(ctx_.marketplace->GetPlatformTreasury());
    return resp;
  });
}

} // namespace market::service
