#pragma once

#include <memory>
#include <mutex>
#include <string>

namespace market::chain {

/*
  Optional off-chain proof oracle.
  Registered by an external collaborator; no settlement path calls it.
*/
class ExecutionVerifier {
 public:
  virtual ~ExecutionVerifier() = default;

  // May throw when the oracle itself fails.
  virtual bool Verify(const std::string& proof) = 0;
};

class VerifierRegistry {
 public:
  void Register(std::shared_ptr<ExecutionVerifier> verifier);
  void Clear();

  // nullptr when nothing is registered
  std::shared_ptr<ExecutionVerifier> Get() const;

 private:
  mutable std::mutex                 mutex_;
  std::shared_ptr<ExecutionVerifier> verifier_;
};

} // namespace market::chain
