#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/gc/gc_scheduler.hpp"

namespace bay::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Not started; the caller runs the startup pass and starts it.
  std::unique_ptr<gc::GcScheduler> gc;
  bool                             gc_run_on_startup = false;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB, driver and adapter types.
*/
Application Build(const bay::runtime::config::RuntimeConfig& config);

// Concrete record store for the configured backend, schema bootstrapped.
std::shared_ptr<db::Repository> BuildRepository(const bay::runtime::config::RuntimeConfig& config);

} // namespace bay::factory
