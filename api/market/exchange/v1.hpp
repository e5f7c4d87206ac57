#pragma once

#include "market/exchange/core/v1/types.pb.h"

#include "market/exchange/services/v1/admin_service.pb.h"
#include "market/exchange/services/v1/auction_service.pb.h"
#include "market/exchange/services/v1/job_service.pb.h"
#include "market/exchange/services/v1/ledger_service.pb.h"
#include "market/exchange/services/v1/resource_registry_service.pb.h"

namespace market::exchange::v1 {
using namespace ::market::exchange::core::v1;
using namespace ::market::exchange::services::v1;
}
