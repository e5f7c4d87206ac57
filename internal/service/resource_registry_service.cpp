#include "resource_registry_service.hpp"

#include "internal/core/marketplace.hpp"
#include "observe_rpc.hpp"

namespace market::service {

using namespace market::exchange::v1;
using detail::ObserveRpc;

ResourceRegistryService::ResourceRegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListResourceResponse ResourceRegistryService::ListResource(const ListResourceRequest& req) {
  return ObserveRpc("ResourceRegistryService.ListResource", req.sender(), [&] {
    detail::RequireSender(req.sender());
    ListResourceResponse resp;
    resp.set_resource_id(ctx_.marketplace->ListResource(req.sender(), req.spec(), req.hourly_rate()));
    return resp;
  });
}

GetResourceResponse ResourceRegistryService::GetResource(const GetResourceRequest& req) {
  return ObserveRpc("ResourceRegistryService.GetResource", "", [&] {
    GetResourceResponse resp;
    *resp.mutable_resource() = ctx_.marketplace->GetResource(req.resource_id());
    return resp;
  });
}

ListResourcesResponse ResourceRegistryService::ListResources(const ListResourcesRequest& req) {
  return ObserveRpc("ResourceRegistryService.ListResources", "", [&] {
    market::db::ResourceFilter filter;
    if (!req.provider().empty()) {
      filter.provider = req.provider();
    }
    filter.available_only = req.available_only();

    ListResourcesResponse resp;
    for (auto& resource : ctx_.marketplace->ListResources(filter, detail::ToPagination(req.page()))) {
      *resp.add_resources() = std::move(resource);
    }
    return resp;
  });
}

} // namespace market::service
