#pragma once

/** \file error_json.hpp
 *  \brief Serialization of app_error for log sinks and HTTP bodies, plus validated construction.
 *
 * Format (flat, key order fixed):
 *   {"code": "NOT_FOUND", "message": "...", "context": {...}, "causeChain": ["...", ...]}
 *
 * causeChain holds messages only, immediate cause first, so records stay flat and
 * bounded no matter how deep the chain is. Output is always valid JSON: strings
 * with invalid UTF-8 are replaced, never rejected.
 */

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "contracts/error.hpp"
#include "contracts/result.hpp"

namespace contracts::core {

auto to_json(const app_error& e) -> nlohmann::ordered_json;

/** \brief Serialized to_json(); indent < 0 produces a single line. */
auto to_json_string(const app_error& e, int indent = -1) -> std::string;

/**
 * \brief Build an app_error from untrusted parts (config files, RPC payloads).
 * \return the error on success; a description of the first violation otherwise:
 *   unknown code name, empty or whitespace-only message, context that is not an object.
 */
auto try_make_error(std::string_view code_name, std::string_view message,
                    const nlohmann::ordered_json& context = nlohmann::ordered_json::object())
    -> result<app_error, std::string>;

} // namespace contracts::core
