#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/job_service.hpp"
#include "market/exchange/v1_grpc.hpp"

namespace market::grpc {

class JobServer final : public market::exchange::v1::JobService::Service {
public:
  explicit JobServer(std::shared_ptr<market::service::JobService> svc);

  ::grpc::Status SubmitExecutionProof(::grpc::ServerContext*,
                                      const market::exchange::v1::SubmitExecutionProofRequest*,
                                      market::exchange::v1::SubmitExecutionProofResponse*) override;

  ::grpc::Status ReleaseMilestone(::grpc::ServerContext*,
                                  const market::exchange::v1::ReleaseMilestoneRequest*,
                                  market::exchange::v1::ReleaseMilestoneResponse*) override;

  ::grpc::Status GetJob(::grpc::ServerContext*,
                        const market::exchange::v1::GetJobRequest*,
                        market::exchange::v1::GetJobResponse*) override;

  ::grpc::Status ListJobs(::grpc::ServerContext*,
                          const market::exchange::v1::ListJobsRequest*,
                          market::exchange::v1::ListJobsResponse*) override;

  ::grpc::Status GetEscrowBalance(::grpc::ServerContext*,
                                  const market::exchange::v1::GetEscrowBalanceRequest*,
                                  market::exchange::v1::GetEscrowBalanceResponse*) override;

  ::grpc::Status ListEscrow(::grpc::ServerContext*,
                            const market::exchange::v1::ListEscrowRequest*,
                            market::exchange::v1::ListEscrowResponse*) override;

  ::grpc::Status GetProviderReputation(::grpc::ServerContext*,
                                       const market::exchange::v1::GetProviderReputationRequest*,
                                       market::exchange::v1::GetProviderReputationResponse*) override;

  ::grpc::Status VerifyExecution(::grpc::ServerContext*,
                                 const market::exchange::v1::VerifyExecutionRequest*,
                                 market::exchange::v1::VerifyExecutionResponse*) override;

private:
  std::shared_ptr<market::service::JobService> service_;
};

}
