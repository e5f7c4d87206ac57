#pragma once

#include <memory>

namespace market::core { class Marketplace; }
namespace market::db { class Repository; }
namespace market::chain {
class BlockClock;
class ManualBlockClock;
class TokenRail;
class VerifierRegistry;
} // namespace market::chain

namespace market::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<market::core::Marketplace>       marketplace;
  std::shared_ptr<market::db::Repository>          repository;
  std::shared_ptr<market::chain::BlockClock>       clock;
  // Set only when the clock is manual; AdvanceBlocks needs it.
  std::shared_ptr<market::chain::ManualBlockClock> manual_clock;
  std::shared_ptr<market::chain::TokenRail>        token_rail;
  std::shared_ptr<market::chain::VerifierRegistry> verifiers;
};

}
