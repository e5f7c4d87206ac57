#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/resource_registry_service.hpp"
#include "market/exchange/v1_grpc.hpp"

namespace market::grpc {

class ResourceRegistryServer final : public market::exchange::v1::ResourceRegistryService::Service {
public:
  explicit ResourceRegistryServer(std::shared_ptr<market::service::ResourceRegistryService> svc);

  ::grpc::Status ListResource(::grpc::ServerContext*,
                              const market::exchange::v1::ListResourceRequest*,
                              market::exchange::v1::ListResourceResponse*) override;

  ::grpc::Status GetResource(::grpc::ServerContext*,
                             const market::exchange::v1::GetResourceRequest*,
                             market::exchange::v1::GetResourceResponse*) override;

  ::grpc::Status ListResources(::grpc::ServerContext*,
                               const market::exchange::v1::ListResourcesRequest*,
                               market::exchange::v1::ListResourcesResponse*) override;

private:
  std::shared_ptr<market::service::ResourceRegistryService> service_;
};

}
