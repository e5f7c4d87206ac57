#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

#include "market/exchange/v1_grpc.hpp"

using namespace market::exchange::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  marketctl <addr> list-resource <sender> <gpu> <cpu> <ram> <hourly_rate>\n"
            << "  marketctl <addr> get-resource <resource_id>\n"
            << "  marketctl <addr> list-resources [provider] [--available]\n"
            << "  marketctl <addr> create-auction <sender> <gpu> <cpu> <ram> <max_duration> <starting_price>\n"
            << "  marketctl <addr> bid <sender> <auction_id> <amount>\n"
            << "  marketctl <addr> end-auction <sender> <auction_id>\n"
            << "  marketctl <addr> get-auction <auction_id>\n"
            << "  marketctl <addr> auction-active <auction_id>\n"
            << "  marketctl <addr> list-auctions [--active]\n"
            << "  marketctl <addr> submit-proof <sender> <job_id> <proof>\n"
            << "  marketctl <addr> release <sender> <job_id> <milestone_index>\n"
            << "  marketctl <addr> get-job <job_id>\n"
            << "  marketctl <addr> list-jobs [--provider <p>] [--requester <r>]\n"
            << "  marketctl <addr> escrow <job_id> <milestone_index>\n"
            << "  marketctl <addr> list-escrow <job_id>\n"
            << "  marketctl <addr> reputation <provider>\n"
            << "  marketctl <addr> verify <job_id>\n"
            << "  marketctl <addr> deposit <sender> <amount>\n"
            << "  marketctl <addr> withdraw <sender> <amount>\n"
            << "  marketctl <addr> balance <principal>\n"
            << "  marketctl <addr> treasury\n"
            << "  marketctl <addr> stats\n"
            << "  marketctl <addr> height\n"
            << "  marketctl <addr> advance <blocks>\n"
            << "  marketctl <addr> audit\n";
}

static uint64_t ParseU64(const std::string& s) {
  if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
    std::cerr << "invalid number: '" << s << "'\n";
    std::exit(1);
  }
  try {
    return std::stoull(s);
  } catch (const std::out_of_range&) {
    std::cerr << "number out of range: '" << s << "'\n";
    std::exit(1);
  }
}

static uint32_t ParseU32(const std::string& s) {
  const auto value = ParseU64(s);
  if (value > std::numeric_limits<uint32_t>::max()) {
    std::cerr << "number out of range: '" << s << "'\n";
    std::exit(1);
  }
  return static_cast<uint32_t>(value);
}

static ResourceSpec MakeSpec(const std::string& gpu, const std::string& cpu, const std::string& ram) {
  ResourceSpec spec;
  spec.set_gpu(ParseU64(gpu));
  spec.set_cpu(ParseU64(cpu));
  spec.set_ram(ParseU64(ram));
  return spec;
}

static std::string StatusCodeName(grpc::StatusCode code) {
  switch (code) {
    case grpc::StatusCode::INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    case grpc::StatusCode::NOT_FOUND:
      return "NOT_FOUND";
    case grpc::StatusCode::ALREADY_EXISTS:
      return "ALREADY_EXISTS";
    case grpc::StatusCode::FAILED_PRECONDITION:
      return "FAILED_PRECONDITION";
    case grpc::StatusCode::UNAVAILABLE:
      return "UNAVAILABLE";
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      return "DEADLINE_EXCEEDED";
    case grpc::StatusCode::UNIMPLEMENTED:
      return "UNIMPLEMENTED";
    default:
      return "INTERNAL";
  }
}

// Prints the response as JSON, or "ERROR_NAME: message" on failure.
template <typename Resp>
static int Report(const grpc::Status& status, const Resp& resp) {
  if (!status.ok()) {
    const auto name = status.error_details().empty() ? StatusCodeName(status.error_code()) : status.error_details();
    std::cerr << name << ": " << status.error_message() << "\n";
    return 2;
  }

  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        print_status = google::protobuf::util::MessageToJsonString(resp, &json, options);
  if (!print_status.ok()) {
    std::cerr << "INTERNAL: " << print_status.message() << "\n";
    return 2;
  }
  std::cout << json << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];
  const int   n    = argc - 3;
  auto        arg  = [&](int i) { return std::string(argv[3 + i]); };

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto registry_stub = ResourceRegistryService::NewStub(channel);
  auto auction_stub  = AuctionService::NewStub(channel);
  auto job_stub      = JobService::NewStub(channel);
  auto ledger_stub   = LedgerService::NewStub(channel);
  auto admin_stub    = MarketAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  // Resource registry
  // ------------------------------------------------------------

  if (cmd == "list-resource" && n == 5) {
    ListResourceRequest req;
    req.set_sender(arg(0));
    *req.mutable_spec() = MakeSpec(arg(1), arg(2), arg(3));
    req.set_hourly_rate(ParseU64(arg(4)));
    ListResourceResponse resp;
    return Report(registry_stub->ListResource(&ctx, req, &resp), resp);
  }

  if (cmd == "get-resource" && n == 1) {
    GetResourceRequest req;
    req.set_resource_id(ParseU64(arg(0)));
    GetResourceResponse resp;
    return Report(registry_stub->GetResource(&ctx, req, &resp), resp);
  }

  if (cmd == "list-resources" && n <= 2) {
    ListResourcesRequest req;
    for (int i = 0; i < n; ++i) {
      if (arg(i) == "--available") {
        req.set_available_only(true);
      } else {
        req.set_provider(arg(i));
      }
    }
    ListResourcesResponse resp;
    return Report(registry_stub->ListResources(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------
  // Auctions
  // ------------------------------------------------------------

  if (cmd == "create-auction" && n == 6) {
    CreateAuctionRequest req;
    req.set_sender(arg(0));
    *req.mutable_requirements() = MakeSpec(arg(1), arg(2), arg(3));
    req.set_max_duration(ParseU64(arg(4)));
    req.set_starting_price(ParseU64(arg(5)));
    CreateAuctionResponse resp;
    return Report(auction_stub->CreateAuction(&ctx, req, &resp), resp);
  }

  if (cmd == "bid" && n == 3) {
    PlaceBidRequest req;
    req.set_sender(arg(0));
    req.set_auction_id(ParseU64(arg(1)));
    req.set_amount(ParseU64(arg(2)));
    PlaceBidResponse resp;
    return Report(auction_stub->PlaceBid(&ctx, req, &resp), resp);
  }

  if (cmd == "end-auction" && n == 2) {
    EndAuctionRequest req;
    req.set_sender(arg(0));
    req.set_auction_id(ParseU64(arg(1)));
    EndAuctionResponse resp;
    return Report(auction_stub->EndAuction(&ctx, req, &resp), resp);
  }

  if (cmd == "get-auction" && n == 1) {
    GetAuctionRequest req;
    req.set_auction_id(ParseU64(arg(0)));
    GetAuctionResponse resp;
    return Report(auction_stub->GetAuction(&ctx, req, &resp), resp);
  }

  if (cmd == "auction-active" && n == 1) {
    IsAuctionActiveRequest req;
    req.set_auction_id(ParseU64(arg(0)));
    IsAuctionActiveResponse resp;
    return Report(auction_stub->IsAuctionActive(&ctx, req, &resp), resp);
  }

  if (cmd == "list-auctions" && n <= 1) {
    ListAuctionsRequest req;
    req.set_active_only(n == 1 && arg(0) == "--active");
    ListAuctionsResponse resp;
    return Report(auction_stub->ListAuctions(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------
  // Jobs, escrow, reputation
  // ------------------------------------------------------------

  if (cmd == "submit-proof" && n == 3) {
    SubmitExecutionProofRequest req;
    req.set_sender(arg(0));
    req.set_job_id(ParseU64(arg(1)));
    req.set_proof(arg(2));
    SubmitExecutionProofResponse resp;
    return Report(job_stub->SubmitExecutionProof(&ctx, req, &resp), resp);
  }

  if (cmd == "release" && n == 3) {
    ReleaseMilestoneRequest req;
    req.set_sender(arg(0));
    req.set_job_id(ParseU64(arg(1)));
    req.set_milestone_index(ParseU32(arg(2)));
    ReleaseMilestoneResponse resp;
    return Report(job_stub->ReleaseMilestone(&ctx, req, &resp), resp);
  }

  if (cmd == "get-job" && n == 1) {
    GetJobRequest req;
    req.set_job_id(ParseU64(arg(0)));
    GetJobResponse resp;
    return Report(job_stub->GetJob(&ctx, req, &resp), resp);
  }

  if (cmd == "list-jobs" && (n == 0 || n == 2 || n == 4)) {
    ListJobsRequest req;
    for (int i = 0; i + 1 < n; i += 2) {
      if (arg(i) == "--provider") {
        req.set_provider(arg(i + 1));
      } else if (arg(i) == "--requester") {
        req.set_requester(arg(i + 1));
      } else {
        Usage();
        return 1;
      }
    }
    ListJobsResponse resp;
    return Report(job_stub->ListJobs(&ctx, req, &resp), resp);
  }

  if (cmd == "escrow" && n == 2) {
    GetEscrowBalanceRequest req;
    req.set_job_id(ParseU64(arg(0)));
    req.set_milestone_index(ParseU32(arg(1)));
    GetEscrowBalanceResponse resp;
    return Report(job_stub->GetEscrowBalance(&ctx, req, &resp), resp);
  }

  if (cmd == "list-escrow" && n == 1) {
    ListEscrowRequest req;
    req.set_job_id(ParseU64(arg(0)));
    ListEscrowResponse resp;
    return Report(job_stub->ListEscrow(&ctx, req, &resp), resp);
  }

  if (cmd == "reputation" && n == 1) {
    GetProviderReputationRequest req;
    req.set_provider(arg(0));
    GetProviderReputationResponse resp;
    return Report(job_stub->GetProviderReputation(&ctx, req, &resp), resp);
  }

  if (cmd == "verify" && n == 1) {
    VerifyExecutionRequest req;
    req.set_job_id(ParseU64(arg(0)));
    VerifyExecutionResponse resp;
    return Report(job_stub->VerifyExecution(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------
  // Ledger
  // ------------------------------------------------------------

  if (cmd == "deposit" && n == 2) {
    DepositFundsRequest req;
    req.set_sender(arg(0));
    req.set_amount(ParseU64(arg(1)));
    DepositFundsResponse resp;
    return Report(ledger_stub->DepositFunds(&ctx, req, &resp), resp);
  }

  if (cmd == "withdraw" && n == 2) {
    WithdrawFundsRequest req;
    req.set_sender(arg(0));
    req.set_amount(ParseU64(arg(1)));
    WithdrawFundsResponse resp;
    return Report(ledger_stub->WithdrawFunds(&ctx, req, &resp), resp);
  }

  if (cmd == "balance" && n == 1) {
    GetUserBalanceRequest req;
    req.set_principal(arg(0));
    GetUserBalanceResponse resp;
    return Report(ledger_stub->GetUserBalance(&ctx, req, &resp), resp);
  }

  if (cmd == "treasury" && n == 0) {
    GetPlatformTreasuryRequest  req;
    GetPlatformTreasuryResponse resp;
    return Report(ledger_stub->GetPlatformTreasury(&ctx, req, &resp), resp);
  }

  // ------------------------------------------------------------
  // Admin
  // ------------------------------------------------------------

  if (cmd == "stats" && n == 0) {
    StatsRequest  req;
    StatsResponse resp;
    return Report(admin_stub->Stats(&ctx, req, &resp), resp);
  }

  if (cmd == "height" && n == 0) {
    GetBlockHeightRequest  req;
    GetBlockHeightResponse resp;
    return Report(admin_stub->GetBlockHeight(&ctx, req, &resp), resp);
  }

  if (cmd == "advance" && n == 1) {
    AdvanceBlocksRequest req;
    req.set_blocks(ParseU64(arg(0)));
    AdvanceBlocksResponse resp;
    return Report(admin_stub->AdvanceBlocks(&ctx, req, &resp), resp);
  }

  if (cmd == "audit" && n == 0) {
    AuditConservationRequest  req;
    AuditConservationResponse resp;
    return Report(admin_stub->AuditConservation(&ctx, req, &resp), resp);
  }

  Usage();
  return 1;
}
