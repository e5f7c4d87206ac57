#pragma once

#include "market/exchange/v1.hpp"

#include "market/exchange/services/v1/admin_service.grpc.pb.h"
#include "market/exchange/services/v1/auction_service.grpc.pb.h"
#include "market/exchange/services/v1/job_service.grpc.pb.h"
#include "market/exchange/services/v1/ledger_service.grpc.pb.h"
#include "market/exchange/services/v1/resource_registry_service.grpc.pb.h"
