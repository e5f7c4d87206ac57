#include "internal/core/db_errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace market::core {

void ThrowIfDbError(const market::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case market::db::ErrorCode::AlreadyExists:
      throw market::util::AlreadyExists(message);
    case market::db::ErrorCode::NotFound:
      throw market::util::NotFound(message);
    case market::db::ErrorCode::Conflict:
      throw market::util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace market::core
