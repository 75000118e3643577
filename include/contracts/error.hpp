#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and the structured error carried as E in result<T, E>.
 *
 * Design:
 * - Stable error kinds for programmatic handling (HTTP/CLI boundaries map them,
 *   see error_mapping.hpp). Adding a kind is a reviewed change.
 * - Human-readable message, JSON-safe context and an optional cause chain.
 * - Values are immutable once built; wrap() creates a new error pointing at the
 *   old one, so chains are acyclic by construction.
 *
 * This header has no dependency on the rest of the library.
 */

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace contracts::core {

/** \brief Stable error kinds used across the ecosystem. */
enum class error_kind : std::uint32_t {
  validation = 2001,
  unauthorized = 4001,
  forbidden = 4003,
  rate_limit_exceeded = 5001,
  not_found = 6001,
  conflict = 6002,
  external_service_error = 7001,
  cancelled = 8001,
  internal = 9001,
};

/** \brief Coarse grouping of kinds, used by boundaries and dashboards. */
enum class error_category {
  validation,
  auth,
  resource,
  system,
  rate_limit,
  cancellation,
};

/** \brief Ordered, JSON-safe key/value context attached to an error. Always an object. */
using context_map = nlohmann::ordered_json;

/** \brief A foreign (non app_error) failure found at the root of a chain. */
struct external_error {
  std::string type;    /**< dynamic type name of the caught exception, if known */
  std::string message; /**< what() of the caught exception */

  friend bool operator==(const external_error&, const external_error&) = default;
};

class app_error;

/** \brief Build a root error. Total: a non-object context is stored under "value". */
auto make_error(error_kind code, std::string message,
                context_map context = context_map::object()) -> app_error;

/** \brief Re-contextualize an error while preserving the chain below it. */
auto wrap(error_kind code, std::string message, app_error cause,
          context_map context = context_map::object()) -> app_error;

/** \brief Build an error whose chain ends in a foreign failure. */
auto from_external(error_kind code, std::string message, external_error origin,
                   context_map context = context_map::object()) -> app_error;

/**
 * \brief Structured application error.
 *
 * Ownership: causes are held by shared immutable reference; copying an
 * app_error is cheap and never duplicates the chain.
 * Thread-safety: immutable, safe to share across threads.
 */
class app_error {
public:
  app_error(error_kind code, std::string message,
            context_map context = context_map::object());
  app_error(const app_error&) = default;
  app_error(app_error&&) noexcept = default;
  auto operator=(const app_error&) -> app_error& = default;
  auto operator=(app_error&&) noexcept -> app_error& = default;
  /** \brief Releases uniquely owned causes one link at a time. */
  ~app_error();

  [[nodiscard]] auto code() const noexcept -> error_kind { return code_; }
  [[nodiscard]] auto message() const noexcept -> const std::string& { return message_; }
  [[nodiscard]] auto context() const noexcept -> const context_map& { return context_; }

  /** \brief Immediate cause, or nullptr at the root. */
  [[nodiscard]] auto cause() const noexcept -> const app_error* { return cause_.get(); }

  /** \brief Foreign failure at the bottom of the chain, or nullptr. */
  [[nodiscard]] auto external_cause() const noexcept -> const external_error*;

  /**
   * \brief Messages of the chain below this error, immediate cause first.
   * The external message closes the chain unless it repeats the root's own message.
   */
  [[nodiscard]] auto cause_chain() const -> std::vector<std::string>;

  /** \brief Deepest app_error of the chain (this error when it has no cause). */
  [[nodiscard]] auto root_cause() const noexcept -> const app_error&;

  friend auto operator==(const app_error& a, const app_error& b) -> bool;

private:
  friend auto wrap(error_kind, std::string, app_error, context_map) -> app_error;
  friend auto from_external(error_kind, std::string, external_error, context_map) -> app_error;

  error_kind code_;
  std::string message_;
  context_map context_;
  std::shared_ptr<app_error> cause_;
  std::shared_ptr<const external_error> external_;
};

/** \brief Wire name, e.g. "NOT_FOUND". */
constexpr auto to_string(error_kind kind) noexcept -> std::string_view {
  switch (kind) {
    case error_kind::validation: return "VALIDATION";
    case error_kind::unauthorized: return "UNAUTHORIZED";
    case error_kind::forbidden: return "FORBIDDEN";
    case error_kind::rate_limit_exceeded: return "RATE_LIMIT_EXCEEDED";
    case error_kind::not_found: return "NOT_FOUND";
    case error_kind::conflict: return "CONFLICT";
    case error_kind::external_service_error: return "EXTERNAL_SERVICE_ERROR";
    case error_kind::cancelled: return "CANCELLED";
    case error_kind::internal: return "INTERNAL";
  }
  return "INTERNAL";
}

/** \brief Inverse of to_string; nullopt for unknown names. */
auto parse_error_kind(std::string_view name) noexcept -> std::optional<error_kind>;

constexpr auto category_of(error_kind kind) noexcept -> error_category {
  switch (kind) {
    case error_kind::validation: return error_category::validation;
    case error_kind::unauthorized:
    case error_kind::forbidden: return error_category::auth;
    case error_kind::not_found:
    case error_kind::conflict: return error_category::resource;
    case error_kind::rate_limit_exceeded: return error_category::rate_limit;
    case error_kind::cancelled: return error_category::cancellation;
    case error_kind::external_service_error:
    case error_kind::internal: return error_category::system;
  }
  return error_category::system;
}

constexpr auto is_in_category(error_kind kind, error_category category) noexcept -> bool {
  return category_of(kind) == category;
}

/** \brief Message suitable for end users; never leaks technical detail. */
auto humanize(const app_error& e) -> std::string;

/**
 * \brief Multi-line diagnostic for developers and logs:
 *   [CODE] message
 *   Details: <context json>     (only when context is non-empty)
 *   Cause: <immediate cause>    (only when a cause exists)
 */
auto format_for_developers(const app_error& e) -> std::string;

} // namespace contracts::core
