/**
 * Command-line boundary example using contracts
 *
 * Usage: contracts_cli_example <port> [retries]
 *
 * This example demonstrates:
 * - Validating configuration from the environment once at startup
 * - Parsing input into result<T> instead of throwing
 * - Chaining fallible steps with flat_map
 * - Turning the final result into an exit code at the single boundary match
 *
 * Environment: CONTRACTS_LOG_FORMAT=text|json, EXAMPLE_HOST (default "localhost").
 */

#include <contracts/boundary.hpp>
#include <contracts/env.hpp>
#include <contracts/result.hpp>

#include <array>
#include <iostream>
#include <span>
#include <string>
#include <vector>

namespace {

using contracts::core::error_kind;

struct endpoint {
    std::string host;
    int port;
    int retries;
};

auto parse_int(const std::string& text, const char* field) -> contracts::result<int> {
    return contracts::from_throwable([&] { return std::stoi(text); })
        .map_error([field](const contracts::core::app_error& e) {
            return contracts::core::wrap(error_kind::validation, std::string(field) + " is not a number", e,
                                         {{"field", field}});
        });
}

auto check_port(int port) -> contracts::result<int> {
    if (port < 1 || port > 65535) {
        return contracts::failure<int>(
            contracts::core::make_error(error_kind::validation, "port out of range", {{"port", port}}));
    }
    return contracts::success(port);
}

auto run(std::span<const std::string> args) -> contracts::result<endpoint> {
    if (args.empty()) {
        return contracts::failure<endpoint>(
            contracts::core::make_error(error_kind::validation, "usage: contracts_cli_example <port> [retries]"));
    }

    const std::array<contracts::config::env_var, 1> schema{{
        {"EXAMPLE_HOST", false, std::string("localhost"), contracts::config::validators::non_empty()},
    }};
    auto host = contracts::config::load_env(schema).map(
        [](const contracts::config::env_values& env) { return env.get("EXAMPLE_HOST").get_or_else("localhost"); });

    auto retries = args.size() > 1 ? parse_int(args[1], "retries") : contracts::success(3);

    return host.flat_map([&](const std::string& h) {
        return parse_int(args[0], "port").flat_map(check_port).flat_map([&](int port) {
            return retries.map([&](int r) { return endpoint{h, port, r}; });
        });
    });
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto options = contracts::boundary_options_from_env().get_or_else_with([](const contracts::core::app_error& e) {
        contracts::report_error(std::cerr, e, {});
        return contracts::boundary_options{};
    });
    options.component = "cli_example";

    return contracts::run_command(
        [&] {
            return run(args).tap([](const endpoint& ep) {
                std::cout << "connecting to " << ep.host << ':' << ep.port << " (retries=" << ep.retries << ")\n";
            });
        },
        options);
}
