#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/service/metadata_service.hpp"
#include "internal/store/api/document_store.hpp"

namespace mlmeta::factory {

/*
  Application

  Owns the long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<store::DocumentStore>      store;
  std::shared_ptr<service::MetadataService>  metadata_service;
};

/*
  BuildStore

  Constructs the configured document store backend (memory when none is
  selected) and bootstraps its schema.

  NOTE:
  Together with Build() this is the composition root of the application and
  the ONLY place allowed to know concrete store types.
*/
std::shared_ptr<store::DocumentStore> BuildStore(const mlmeta::runtime::config::StoreConfig& config);

Application Build(const mlmeta::runtime::config::RuntimeConfig& config);

} // namespace mlmeta::factory
