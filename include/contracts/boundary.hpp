#pragma once

/** \file boundary.hpp
 *  \brief HTTP handler / CLI entry point conventions: one match per request or command.
 *
 * The boundary is where the algebra becomes an effect: a status code and body, or
 * a process exit code and one diagnostic line on stderr. Everything inside the
 * boundary returns result<T> and never logs or exits on its own.
 *
 * Configuration: CONTRACTS_LOG_FORMAT = text (default) | json.
 */

#include <functional>
#include <iostream>
#include <ostream>
#include <string>

#include "contracts/env.hpp"
#include "contracts/error.hpp"
#include "contracts/error_json.hpp"
#include "contracts/error_mapping.hpp"
#include "contracts/result.hpp"
#include "contracts/throwable.hpp"

namespace contracts {

enum class log_format { text, json };

struct boundary_options {
  log_format format{log_format::text};
  std::string component{"contracts"}; /**< tag on report lines, e.g. "[billing][error]" */
};

/** \brief Options from CONTRACTS_LOG_FORMAT; an unknown value is a VALIDATION failure. */
auto boundary_options_from_env(const config::env_lookup& lookup = config::safe_getenv) -> result<boundary_options>;

/**
 * \brief Write one line describing e.
 *   text: [component][error] [CODE] message (cause: m1 <- m2)
 *   json: the to_json() record on a single line
 */
void report_error(std::ostream& os, const core::app_error& e, const boundary_options& opts);

struct http_response {
  int status{core::http_ok};
  std::string body;
};

/** \brief 200 with render(value) as body, or the mapped status with the error record as body. */
template <typename T, typename Render>
auto to_http_response(const result<T>& outcome, Render&& render) -> http_response {
  return outcome.match(
      [&render](const T& value) { return http_response{core::http_ok, std::invoke(render, value)}; },
      [](const core::app_error& e) { return http_response{core::to_http_status(e.code()), core::to_json_string(e)}; });
}

/**
 * \brief Run a command at a CLI entry point and return the process exit code.
 * command returns result<T> (or a plain value); exceptions it lets escape are
 * folded by from_throwable. A failure is reported once on err.
 */
template <typename F>
auto run_command(F&& command, const boundary_options& opts = {}, std::ostream& err = std::cerr) -> int {
  return from_throwable(std::forward<F>(command))
      .match([](const auto&) { return core::exit_success; },
             [&](const core::app_error& e) {
               report_error(err, e, opts);
               return core::to_exit_code(e.code());
             });
}

} // namespace contracts
