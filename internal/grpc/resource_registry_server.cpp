#include "resource_registry_server.hpp"

#include "grpc_error.hpp"

namespace market::grpc {

using namespace market::exchange::v1;

ResourceRegistryServer::ResourceRegistryServer(std::shared_ptr<market::service::ResourceRegistryService> svc) : service_(std::move(svc)) {
}

::grpc::Status ResourceRegistryServer::ListResource(::grpc::ServerContext*, const ListResourceRequest* req, ListResourceResponse* resp) {
  try {
    *resp = service_->ListResource(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ResourceRegistryServer::GetResource(::grpc::ServerContext*, const GetResourceRequest* req, GetResourceResponse* resp) {
  try {
    *resp = service_->GetResource(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ResourceRegistryServer::ListResources(::grpc::ServerContext*, const ListResourcesRequest* req, ListResourcesResponse* resp) {
  try {
    *resp = service_->ListResources(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace market::grpc
