#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"

namespace market::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext context;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Opens the configured backend and runs the schema migrations.
  No database section selects the in-memory repository.
*/
std::shared_ptr<db::Repository> BuildRepository(const market::runtime::config::RuntimeConfig& config);

// Repository, chain collaborators and the marketplace, without transport.
service::ServiceContext BuildContext(const market::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and chain types.
*/
Application Build(const market::runtime::config::RuntimeConfig& config);

}
