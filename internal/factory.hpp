#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/engine_config.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/odds_service.hpp"

namespace gaitrank::factory {

/*
  Application

  Owns all long-lived components of one CLI run.
*/
struct Application {
  config::EngineConfig            engine;
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<service::IngestService>  ingest_service;
  std::shared_ptr<service::OddsService>    odds_service;
  std::shared_ptr<service::CatalogService> catalog_service;
};

/*
  Build

  Constructs the whole engine from runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const gaitrank::runtime::config::RuntimeConfig& config);

// Same graph on top of an existing repository (tests, tools).
Application Build(const config::EngineConfig& engine, std::shared_ptr<db::Repository> repository);

std::shared_ptr<db::Repository> BuildRepository(const gaitrank::runtime::config::DatabaseConfig& database);

} // namespace gaitrank::factory
