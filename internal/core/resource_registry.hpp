#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace market::core {

struct ResourceCapacity {
  uint64_t gpu = 0;
  uint64_t cpu = 0;
  uint64_t ram = 0;
};

/*
  Compute offers listed by providers.
  Capacities and rates are stored as given, zero included.
*/
class ResourceRegistry {
 public:
  explicit ResourceRegistry(std::shared_ptr<market::db::Repository> repository);

  market::db::model::ResourceRecord List(market::db::Transaction& tx, const std::string& provider, const ResourceCapacity& capacity,
                                         uint64_t hourly_rate, uint64_t height);

  // Throws ResourceNotFound.
  market::db::model::ResourceRecord Get(market::db::Transaction& tx, uint64_t resource_id) const;

  std::vector<market::db::model::ResourceRecord> Find(market::db::Transaction& tx, const market::db::ResourceFilter& filter,
                                                      const market::db::Pagination& page) const;

 private:
  std::shared_ptr<market::db::Repository> repository_;
};

} // namespace market::core
