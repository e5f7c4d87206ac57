#include "internal/core/conversions.hpp"

namespace market::core {

using namespace market::exchange::v1;

ComputeResource ToProto(const db::model::ResourceRecord& record) {
  ComputeResource resource;
  resource.set_id(record.id);
  resource.set_provider(record.provider);
  resource.mutable_spec()->set_gpu(record.gpu);
  resource.mutable_spec()->set_cpu(record.cpu);
  resource.mutable_spec()->set_ram(record.ram);
  resource.set_hourly_rate(record.hourly_rate);
  resource.set_available(record.available);
  resource.set_created_at_height(record.created_at_height);
  return resource;
}

Auction ToProto(const db::model::AuctionRecord& record) {
  Auction auction;
  auction.set_id(record.id);
  auction.set_requester(record.requester);
  auction.mutable_requirements()->set_gpu(record.req_gpu);
  auction.mutable_requirements()->set_cpu(record.req_cpu);
  auction.mutable_requirements()->set_ram(record.req_ram);
  auction.set_max_duration(record.max_duration);
  auction.set_starting_price(record.starting_price);
  auction.set_current_bid(record.current_bid);
  if (record.current_bidder) {
    auction.set_current_bidder(*record.current_bidder);
  }
  auction.set_end_height(record.end_height);
  auction.set_ended(record.ended);
  auction.set_created_at_height(record.created_at_height);
  return auction;
}

Job ToProto(const db::model::JobRecord& record) {
  Job job;
  job.set_id(record.id);
  job.set_auction_id(record.auction_id);
  job.set_provider(record.provider);
  job.set_requester(record.requester);
  job.set_total_payment(record.total_payment);
  job.set_milestone_count(record.milestone_count);
  job.set_completed_milestones(record.completed_milestones);
  if (record.execution_proof) {
    job.set_execution_proof(*record.execution_proof);
  }
  job.set_status(record.status);
  job.set_created_at_height(record.created_at_height);
  return job;
}

EscrowEntry ToProto(const db::model::EscrowRecord& record) {
  EscrowEntry entry;
  entry.set_job_id(record.job_id);
  entry.set_milestone_index(record.milestone_index);
  entry.set_amount(record.amount);
  entry.set_released(record.released);
  return entry;
}

Reputation ToProto(const db::model::ReputationRecord& record) {
  Reputation reputation;
  reputation.set_provider(record.provider);
  reputation.set_score(record.score);
  reputation.set_completed_jobs(record.completed_jobs);
  reputation.set_total_jobs(record.total_jobs);
  reputation.set_total_earned(record.total_earned);
  return reputation;
}

} // namespace market::core
