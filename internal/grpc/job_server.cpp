#include "job_server.hpp"

#include "grpc_error.hpp"

namespace market::grpc {

using namespace market::exchange::v1;

JobServer::JobServer(std::shared_ptr<market::service::JobService> svc) : service_(std::move(svc)) {
}

::grpc::Status JobServer::SubmitExecutionProof(::grpc::ServerContext*, const SubmitExecutionProofRequest* req, SubmitExecutionProofResponse* resp) {
  try {
    *resp = service_->SubmitExecutionProof(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ReleaseMilestone(::grpc::ServerContext*, const ReleaseMilestoneRequest* req, ReleaseMilestoneResponse* resp) {
  try {
    *resp = service_->ReleaseMilestone(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetJob(::grpc::ServerContext*, const GetJobRequest* req, GetJobResponse* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ListJobs(::grpc::ServerContext*, const ListJobsRequest* req, ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetEscrowBalance(::grpc::ServerContext*, const GetEscrowBalanceRequest* req, GetEscrowBalanceResponse* resp) {
  try {
    *resp = service_->GetEscrowBalance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ListEscrow(::grpc::ServerContext*, const ListEscrowRequest* req, ListEscrowResponse* resp) {
  try {
    *resp = service_->ListEscrow(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetProviderReputation(::grpc::ServerContext*, const GetProviderReputationRequest* req, GetProviderReputationResponse* resp) {
  try {
    *resp = service_->GetProviderReputation(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::VerifyExecution(::grpc::ServerContext*, const VerifyExecutionRequest* req, VerifyExecutionResponse* resp) {
  try {
    *resp = service_->VerifyExecution(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace market::grpc
