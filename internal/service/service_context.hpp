#pragma once

#include <cstddef>
#include <memory>

#include "internal/query/listing.hpp"

namespace mlmeta::store {
class DocumentStore;
}

namespace mlmeta::service {

struct ListingOptions {
  std::size_t default_run_limit = mlmeta::query::kDefaultRunLimit;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<mlmeta::store::DocumentStore> store;
  ListingOptions                                listing;
};

} // namespace mlmeta::service
