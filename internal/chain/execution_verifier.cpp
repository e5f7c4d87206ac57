#include "internal/chain/execution_verifier.hpp"

namespace market::chain {

void VerifierRegistry::Register(std::shared_ptr<ExecutionVerifier> verifier) {
  std::lock_guard lock(mutex_);
  verifier_ = std::move(verifier);
}

void VerifierRegistry::Clear() {
  std::lock_guard lock(mutex_);
  verifier_.reset();
}

std::shared_ptr<ExecutionVerifier> VerifierRegistry::Get() const {
  std::lock_guard lock(mutex_);
  return verifier_;
}

} // namespace market::chain
