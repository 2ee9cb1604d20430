#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace bay::core {

// Converts a failed store Result into the typed error surfaced to callers.
inline void ThrowIfDbError(const bay::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case bay::db::ErrorCode::AlreadyExists:
    case bay::db::ErrorCode::Conflict:
      throw bay::util::Conflict(message);
    case bay::db::ErrorCode::NotFound:
      throw bay::util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace bay::core
