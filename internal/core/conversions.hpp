#pragma once

#include "internal/db/model/auction_record.hpp"
#include "internal/db/model/escrow_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/reputation_record.hpp"
#include "internal/db/model/resource_record.hpp"
#include "market/exchange/v1.hpp"

namespace market::core {

// Record -> wire type. Optional strings become empty strings.
market::exchange::v1::ComputeResource ToProto(const db::model::ResourceRecord& record);
market::exchange::v1::Auction         ToProto(const db::model::AuctionRecord& record);
market::exchange::v1::Job             ToProto(const db::model::JobRecord& record);
market::exchange::v1::EscrowEntry     ToProto(const db::model::EscrowRecord& record);
market::exchange::v1::Reputation      ToProto(const db::model::ReputationRecord& record);

} // namespace market::core
