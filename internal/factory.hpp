#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/cache/replay_store.hpp"
#include "internal/core/submission_pipeline.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/http/http_handler.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/submission_service.hpp"

namespace gate::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>     repository;
  std::shared_ptr<cache::ReplayStore> replay_store;

  std::shared_ptr<core::SubmissionPipeline> pipeline;
  std::shared_ptr<service::SubmissionService> submission_service;
  std::shared_ptr<service::AdminService> admin_service;

  std::shared_ptr<http::HttpHandler> http_handler;
  runtime::ServerOptions server_options;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and cache types.
*/
Application Build(const gate::runtime::config::RuntimeConfig& config);

// Repository alone, schema bootstrapped; used by gatectl.
std::shared_ptr<db::Repository> BuildRepository(const gate::runtime::config::RuntimeConfig& config);

std::shared_ptr<cache::ReplayStore> BuildReplayStore(const gate::runtime::config::RuntimeConfig& config);

} // namespace gate::factory
