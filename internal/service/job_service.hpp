#pragma once

#include "market/exchange/v1.hpp"
#include "service_context.hpp"

namespace market::service {

class JobService {
public:
  explicit JobService(ServiceContext ctx);

  market::exchange::v1::SubmitExecutionProofResponse
  SubmitExecutionProof(const market::exchange::v1::SubmitExecutionProofRequest& req);

  market::exchange::v1::ReleaseMilestoneResponse
  ReleaseMilestone(const market::exchange::v1::ReleaseMilestoneRequest& req);

  market::exchange::v1::GetJobResponse
  GetJob(const market::exchange::v1::GetJobRequest& req);

  market::exchange::v1::ListJobsResponse
  ListJobs(const market::exchange::v1::ListJobsRequest& req);

  market::exchange::v1::GetEscrowBalanceResponse
  GetEscrowBalance(const market::exchange::v1::GetEscrowBalanceRequest& req);

  market::exchange::v1::ListEscrowResponse
  ListEscrow(const market::exchange::v1::ListEscrowRequest& req);

  market::exchange::v1::GetProviderReputationResponse
  GetProviderReputation(const market::exchange::v1::GetProviderReputationRequest& req);

  market::exchange::v1::VerifyExecutionResponse
  VerifyExecution(const market::exchange::v1::VerifyExecutionRequest& req);

private:
  ServiceContext ctx_;
};

}
