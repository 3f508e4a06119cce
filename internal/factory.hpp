#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/catalog/memory_catalog.hpp"
#include "internal/core/progress_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_bus.hpp"
#include "internal/stats/aggregator.hpp"

namespace pagewise::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects of one engine instance. The engine and the
  aggregator share the repository and the catalog.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<catalog::MemoryCatalog>  catalog;
  std::shared_ptr<events::EventBus>        events;
  std::shared_ptr<core::ProgressEngine>    engine;
  std::shared_ptr<stats::Aggregator>       aggregator;
};

core::EngineOptions BuildEngineOptions(const pagewise::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root: the only place that knows concrete repository types.
  Expects a config that went through ConfigLoader::Validate.
*/
RuntimeDependencies Build(const pagewise::runtime::config::RuntimeConfig& config);

} // namespace pagewise::factory
