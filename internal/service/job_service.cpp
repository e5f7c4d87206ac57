#include "job_service.hpp"

#include "internal/core/marketplace.hpp"
#include "observe_rpc.hpp"

namespace market::service {

using namespace market::exchange::v1;
using detail::ObserveRpc;

JobService::JobService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitExecutionProofResponse JobService::SubmitExecutionProof(const SubmitExecutionProofRequest& req) {
  return ObserveRpc("JobService.SubmitExecutionProof", req.sender(), [&] {
    detail::RequireSender(req.sender());
    SubmitExecutionProofResponse resp;
    *resp.mutable_job() = ctx_.marketplace->SubmitExecutionProof(req.sender(), req.job_id(), req.proof());
    return resp;
  });
}

ReleaseMilestoneResponse JobService::ReleaseMilestone(const ReleaseMilestoneRequest& req) {
  return ObserveRpc("JobService.ReleaseMilestone", req.sender(), [&] {
    detail::RequireSender(req.sender());
    return ctx_.marketplace->ReleaseMilestone(req.sender(), req.job_id(), req.milestone_index());
  });
}

GetJobResponse JobService::GetJob(const GetJobRequest& req) {
  return ObserveRpc("JobService.GetJob", "", [&] {
    GetJobResponse resp;
    *resp.mutable_job() = ctx_.marketplace->GetJob(req.job_id());
    return resp;
  });
}

ListJobsResponse JobService::ListJobs(const ListJobsRequest& req) {
  return ObserveRpc("JobService.ListJobs", "", [&] {
    market::db::JobFilter filter;
    if (!req.provider().empty()) {
      filter.provider = req.provider();
    }
    if (!req.requester().empty()) {
      filter.requester = req.requester();
    }

    ListJobsResponse resp;
    for (auto& job : ctx_.marketplace->ListJobs(filter, detail::ToPagination(req.page()))) {
      *resp.add_jobs() = std::move(job);
    }
    return resp;
  });
}

GetEscrowBalanceResponse JobService::GetEscrowBalance(const GetEscrowBalanceRequest& req) {
  return ObserveRpc("JobService.GetEscrowBalance", "", [&] {
    GetEscrowBalanceResponse resp;
    *resp.mutable_entry() = ctx_.marketplace->GetEscrowBalance(req.job_id(), req.milestone_index());
    return resp;
  });
}

ListEscrowResponse JobService::ListEscrow(const ListEscrowRequest& req) {
  return ObserveRpc("JobService.ListEscrow", "", [&] {
    ListEscrowResponse resp;
    for (auto& entry : ctx_.marketplace->ListEscrow(req.job_id())) {
      *resp.add_entries() = std::move(entry);
    }
    return resp;
  });
}

GetProviderReputationResponse JobService::GetProviderReputation(const GetProviderReputationRequest& req) {
  return ObserveRpc("JobService.GetProviderReputation", req.provider(), [&] {
    GetProviderReputationResponse resp;
    *resp.mutable_reputation() = ctx_.marketplace->GetProviderReputation(req.provider());
    return resp;
  });
}

VerifyExecutionResponse JobService::VerifyExecution(const VerifyExecutionRequest& req) {
  return ObserveRpc("JobService.VerifyExecution", "", [&] {
    VerifyExecutionResponse resp;
    resp.set_verified(ctx_.marketplace->VerifyExecution(req.job_id()));
    return resp;
  });
}

} // namespace market::service
