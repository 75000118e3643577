#pragma once

/** \file error_mapping.hpp
 *  \brief error_kind -> HTTP status / process exit code conventions used by boundaries.
 *
 * A failed operation is fatal to the current request or command, not to the process.
 */

#include "contracts/error.hpp"

namespace contracts::core {

inline constexpr int exit_success = 0;
inline constexpr int exit_failure = 1;
inline constexpr int http_ok = 200;

constexpr int to_http_status(error_kind kind) {
  switch (kind) {
    case error_kind::not_found: return 404;
    case error_kind::validation: return 400;
    case error_kind::conflict: return 400;
    case error_kind::unauthorized: return 401;
    case error_kind::forbidden: return 403;
    case error_kind::rate_limit_exceeded: return 429;
    case error_kind::cancelled: return 499; // client closed request
    case error_kind::external_service_error: return 500;
    case error_kind::internal: return 500;
  }
  return 500;
}

constexpr int to_exit_code(error_kind kind) {
  switch (kind) {
    case error_kind::not_found:
    case error_kind::validation:
    case error_kind::conflict:
    case error_kind::unauthorized:
    case error_kind::forbidden:
    case error_kind::rate_limit_exceeded:
    case error_kind::cancelled:
    case error_kind::external_service_error:
    case error_kind::internal: return exit_failure;
  }
  return exit_failure;
}

/** \brief Whether a retry collaborator may try again (the retry policy itself lives elsewhere). */
constexpr bool is_retryable(error_kind kind) {
  return kind == error_kind::external_service_error || kind == error_kind::rate_limit_exceeded;
}

} // namespace contracts::core
