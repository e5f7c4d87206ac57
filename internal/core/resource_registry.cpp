#include "internal/core/resource_registry.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace market::core {

ResourceRegistry::ResourceRegistry(std::shared_ptr<market::db::Repository> repository) : repository_(std::move(repository)) {
}

market::db::model::ResourceRecord ResourceRegistry::List(market::db::Transaction& tx, const std::string& provider,
                                                         const ResourceCapacity& capacity, uint64_t hourly_rate, uint64_t height) {
  market::db::model::ResourceRecord record;
  record.provider          = provider;
  record.gpu               = capacity.gpu;
  record.cpu               = capacity.cpu;
  record.ram               = capacity.ram;
  record.hourly_rate       = hourly_rate;
  record.available         = true;
  record.created_at_height = height;

  ThrowIfDbError(repository_->InsertResource(tx, record), "list resource");
  return record;
}

market::db::model::ResourceRecord ResourceRegistry::Get(market::db::Transaction& tx, uint64_t resource_id) const {
  auto record = repository_->GetResource(tx, resource_id);
  if (!record) {
    throw market::util::ResourceNotFound("resource " + std::to_string(resource_id));
  }
  return *record;
}

std::vector<market::db::model::ResourceRecord> ResourceRegistry::Find(market::db::Transaction& tx, const market::db::ResourceFilter& filter,
                                                                      const market::db::Pagination& page) const {
  return repository_->ListResources(tx, filter, page);
}

} // namespace market::core
