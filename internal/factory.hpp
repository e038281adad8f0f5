#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/service/service_context.hpp"

namespace impact::factory {

/*
  Application

  Everything the process needs for its lifetime: the gRPC adapters plus the
  service context they were built from (kept for tooling and tests).
*/
struct Application {
  service::ServiceContext                       context;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const impact::runtime::config::RuntimeConfig& config);

// Repository selected by config.database(); in-memory when unset. Schema is
// created if missing.
std::shared_ptr<db::Repository> BuildRepository(const impact::runtime::config::RuntimeConfig& config);

// Engine and service wiring over an existing repository. Zero engine fields
// keep the built-in defaults.
service::ServiceContext BuildContext(const impact::runtime::config::EngineConfig& engine_config, std::shared_ptr<db::Repository> repository);

} // namespace impact::factory
