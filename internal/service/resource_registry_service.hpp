#pragma once

#include "market/exchange/v1.hpp"
#include "service_context.hpp"

namespace market::service {

class ResourceRegistryService {
public:
  explicit ResourceRegistryService(ServiceContext ctx);

  market::exchange::v1::ListResourceResponse
  ListResource(const market::exchange::v1::ListResourceRequest& req);

  market::exchange::v1::GetResourceResponse
  GetResource(const market::exchange::v1::GetResourceRequest& req);

  market::exchange::v1::ListResourcesResponse
  ListResources(const market::exchange::v1::ListResourcesRequest& req);

private:
  ServiceContext ctx_;
};

}
