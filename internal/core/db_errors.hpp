#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace market::core {

// Raises the util storage error matching a failed repository result.
void ThrowIfDbError(const market::db::Result& result, const std::string& context);

} // namespace market::core
