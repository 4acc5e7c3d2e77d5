#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/core/resource_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/resource_service.hpp"

namespace siros::factory {

/*
  Application

  Owns every long-lived object of the server. Everything here lives
  for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<core::ResourceManager>        manager;
  std::shared_ptr<service::ResourceService>     resource_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Composition root. The only place that knows concrete backend types.

  Opens the configured store (memory when none is configured), runs its
  migrations, and wires embedder, validator, manager and transport.
*/
Application Build(const siros::runtime::config::RuntimeConfig& config);

// Opens and bootstraps the configured repository.
std::shared_ptr<db::Repository> BuildRepository(const siros::runtime::config::RuntimeConfig& config);

} // namespace siros::factory
