#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/upload_context.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/objectstore/object_store.hpp"
#include "internal/service/upload_service.hpp"

namespace upload::factory {

/*
  Application

  Owns all long-lived singletons used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>                repository;
  std::shared_ptr<objectstore::ObjectStore>      object_store;
  std::shared_ptr<service::UploadService>        upload_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// `uploads` config section with defaults for unset fields.
core::UploadOptions BuildUploadOptions(const upload::runtime::config::UploadsConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const upload::runtime::config::RuntimeConfig& config);

std::shared_ptr<objectstore::ObjectStore> BuildObjectStore(const upload::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and store types.
*/
Application Build(const upload::runtime::config::RuntimeConfig& config);

} // namespace upload::factory
