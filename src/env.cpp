#include "contracts/env.hpp"

#include <charconv>
#include <cstdlib>
#include <memory>
#include <utility>

namespace contracts::config {

namespace {

// Base-10 integer with an optional leading '+'; "+-5" and " 5" are rejected.
auto parse_integer(std::string_view text) -> std::optional<long long> {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
    if (!text.empty() && (text.front() == '-' || text.front() == '+')) return std::nullopt;
  }
  if (text.empty()) return std::nullopt;
  long long v = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
  return v;
}

} // namespace

auto safe_getenv(const char* name) noexcept -> std::optional<std::string> {
  if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
  char* raw = nullptr;
  size_t len = 0;
  const errno_t err = _dupenv_s(&raw, &len, name);
  std::unique_ptr<char, void (*)(void*)> owned(raw, std::free);
  if (err != 0 || !owned) return std::nullopt;
  return std::optional<std::string>(std::in_place, owned.get());
#else
  const char* value = std::getenv(name);
  return value ? std::optional<std::string>(std::in_place, value) : std::nullopt;
#endif
}

auto env_values::get(std::string_view name) const -> option<std::string> {
  auto it = values_.find(name);
  if (it == values_.end()) return none<std::string>();
  return some(it->second);
}

auto env_values::get_int(std::string_view name) const -> option<long long> {
  return get(name).flat_map([](const std::string& raw) { return from_optional(parse_integer(raw)); });
}

auto load_env(std::span<const env_var> schema, const env_lookup& lookup) -> result<env_values> {
  env_values out;
  auto issues = core::context_map::array();
  auto missing = core::context_map::array();

  for (const auto& var : schema) {
    auto raw = lookup(var.name.c_str());
    if (!raw) {
      if (var.default_value) {
        out.values_.emplace(var.name, *var.default_value);
      } else if (var.required) {
        issues.push_back({{"path", var.name}, {"message", "Required"}});
        missing.push_back(var.name);
      }
      continue;
    }
    if (!var.validate) {
      out.values_.emplace(var.name, std::move(*raw));
      continue;
    }
    var.validate(*raw).match(
        [&](const std::string& accepted) { out.values_.emplace(var.name, accepted); },
        [&](const std::string& reason) { issues.push_back({{"path", var.name}, {"message", reason}}); });
  }

  if (!issues.empty()) {
    core::context_map context = core::context_map::object();
    context["issues"] = std::move(issues);
    context["missingVariables"] = std::move(missing);
    return failure<env_values>(
        core::make_error(core::error_kind::validation, "Environment validation failed", std::move(context)));
  }
  return success(std::move(out));
}

namespace validators {

auto non_empty() -> env_validator {
  return [](const std::string& v) -> result<std::string, std::string> {
    if (v.empty()) return result<std::string, std::string>::failure("must not be empty");
    return result<std::string, std::string>::success(v);
  };
}

auto min_length(std::size_t n) -> env_validator {
  return [n](const std::string& v) -> result<std::string, std::string> {
    if (v.size() < n) {
      return result<std::string, std::string>::failure("must be at least " + std::to_string(n) + " characters");
    }
    return result<std::string, std::string>::success(v);
  };
}

auto one_of(std::vector<std::string> allowed) -> env_validator {
  return [allowed = std::move(allowed)](const std::string& v) -> result<std::string, std::string> {
    for (const auto& a : allowed) {
      if (a == v) return result<std::string, std::string>::success(v);
    }
    std::string expected;
    for (const auto& a : allowed) {
      if (!expected.empty()) expected += " | ";
      expected += a;
    }
    return result<std::string, std::string>::failure("expected one of: " + expected);
  };
}

auto integer_in(long long min, long long max) -> env_validator {
  return [min, max](const std::string& v) -> result<std::string, std::string> {
    auto parsed = parse_integer(v);
    if (!parsed) return result<std::string, std::string>::failure("expected an integer");
    if (*parsed < min || *parsed > max) {
      return result<std::string, std::string>::failure("must be between " + std::to_string(min) + " and " +
                                                       std::to_string(max));
    }
    return result<std::string, std::string>::success(std::to_string(*parsed));
  };
}

} // namespace validators

} // namespace contracts::config
