#pragma once

/** \file env.hpp
 *  \brief Environment-variable configuration, validated once at the process edge.
 *
 * Pattern: declare the variables a program reads (env_var), call load_env() once at
 * startup and carry the resulting env_values inward. Code past the boundary trusts
 * the values and never re-validates.
 *
 * Errors: a single VALIDATION app_error "Environment validation failed" whose
 * context lists every issue ({"path", "message"}) and every missing required
 * variable ("missingVariables"), so one run reports all problems.
 */

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "contracts/error.hpp"
#include "contracts/option.hpp"
#include "contracts/result.hpp"

namespace contracts::config {

/**
 * \brief Cross-platform getenv wrapper.
 * Returns std::nullopt if the variable is not set. If set but empty, returns an
 * engaged optional with an empty string.
 */
auto safe_getenv(const char* name) noexcept -> std::optional<std::string>;

using env_lookup = std::function<std::optional<std::string>(const char*)>;

/** \brief Checks (and may normalize) a raw value; failure carries a short reason. */
using env_validator = std::function<result<std::string, std::string>(const std::string&)>;

struct env_var {
  std::string name;                         /**< variable name, e.g. "PORT" */
  bool required{true};                      /**< missing and no default -> issue */
  std::optional<std::string> default_value; /**< used when unset; not validated */
  env_validator validate;                   /**< optional; empty means accept as-is */
};

class env_values;

/** \brief Read and validate every variable of the schema; see the file comment for errors. */
auto load_env(std::span<const env_var> schema, const env_lookup& lookup = safe_getenv)
    -> result<env_values>;

/** \brief Trusted, validated configuration values. */
class env_values {
public:
  [[nodiscard]] auto get(std::string_view name) const -> option<std::string>;
  [[nodiscard]] auto get_int(std::string_view name) const -> option<long long>;
  [[nodiscard]] auto size() const noexcept -> std::size_t { return values_.size(); }

private:
  friend auto load_env(std::span<const env_var>, const env_lookup&) -> result<env_values>;

  std::map<std::string, std::string, std::less<>> values_;
};

namespace validators {

auto non_empty() -> env_validator;
auto min_length(std::size_t n) -> env_validator;
auto one_of(std::vector<std::string> allowed) -> env_validator;
/** \brief Base-10 integer within [min, max]; the value is normalized (e.g. "+08" -> "8"). */
auto integer_in(long long min, long long max) -> env_validator;

} // namespace validators

} // namespace contracts::config
