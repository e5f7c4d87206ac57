#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace market::db {

struct Pagination {
  std::size_t limit  = 100;
  std::size_t offset = 0;
};

struct ResourceFilter {
  std::optional<std::string> provider;
  bool                       available_only = false;
};

struct AuctionFilter {
  // Un-ended auctions only; the height check is left to the caller.
  bool open_only = false;
};

struct JobFilter {
  std::optional<std::string> provider;
  std::optional<std::string> requester;
};

} // namespace market::db
