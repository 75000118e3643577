#include "contracts/boundary.hpp"

#include <array>

namespace contracts {

auto boundary_options_from_env(const config::env_lookup& lookup) -> result<boundary_options> {
  const std::array<config::env_var, 1> schema{{
      {"CONTRACTS_LOG_FORMAT", false, std::string("text"), config::validators::one_of({"text", "json"})},
  }};
  return config::load_env(schema, lookup).map([](const config::env_values& env) {
    boundary_options opts;
    opts.format = env.get("CONTRACTS_LOG_FORMAT").get_or_else("text") == "json" ? log_format::json
                                                                               : log_format::text;
    return opts;
  });
}

void report_error(std::ostream& os, const core::app_error& e, const boundary_options& opts) {
  if (opts.format == log_format::json) {
    os << core::to_json_string(e) << '\n';
    return;
  }
  os << '[' << opts.component << "][error] [" << core::to_string(e.code()) << "] " << e.message();
  const auto chain = e.cause_chain();
  if (!chain.empty()) {
    os << " (cause: ";
    for (std::size_t i = 0; i < chain.size(); ++i) {
      if (i) os << " <- ";
      os << chain[i];
    }
    os << ')';
  }
  os << '\n';
}

} // namespace contracts
