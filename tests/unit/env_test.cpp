#include <contracts/env.hpp>
#include <catch2/catch.hpp>

#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace contracts;
using namespace contracts::config;
using contracts::core::app_error;
using contracts::core::error_kind;

// Deterministic stand-in for the process environment.
static auto fake_env(std::map<std::string, std::string> vars) -> env_lookup {
  return [vars = std::move(vars)](const char* name) -> std::optional<std::string> {
    auto it = vars.find(name);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  };
}

static void set_env_var(const char* name, const char* value) {
#if defined(_WIN32)
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

static void unset_env_var(const char* name) {
#if defined(_WIN32)
  _putenv_s(name, "");
#else
  unsetenv(name);
#endif
}

static auto server_schema() -> std::vector<env_var> {
  return {
      {"API_TOKEN", true, std::nullopt, validators::min_length(8)},
      {"PORT", false, std::string("8080"), validators::integer_in(1, 65535)},
      {"MODE", true, std::nullopt, validators::one_of({"dev", "prod"})},
      {"REGION", false, std::nullopt, {}},
  };
}

static auto failure_context(const result<env_values>& r) -> core::context_map {
  return r.match([](const env_values&) { return core::context_map(); },
                 [](const app_error& e) {
                   REQUIRE(e.code() == error_kind::validation);
                   REQUIRE(e.message() == "Environment validation failed");
                   return e.context();
                 });
}

TEST_CASE("load_env: valid environment, defaults applied", "[config][env]") {
  auto schema = server_schema();
  auto loaded = load_env(schema, fake_env({{"API_TOKEN", "s3cr3t-token"}, {"MODE", "prod"}}));
  loaded.match(
      [](const env_values& env) {
        REQUIRE(env.get("API_TOKEN") == some(std::string("s3cr3t-token")));
        REQUIRE(env.get_int("PORT") == some(8080LL));
        REQUIRE(env.get("MODE") == some(std::string("prod")));
        REQUIRE(env.get("REGION") == none<std::string>());
        REQUIRE(env.size() == 3);
      },
      [](const app_error& e) { FAIL(core::format_for_developers(e)); });
}

TEST_CASE("load_env: integer values are normalized", "[config][env]") {
  auto schema = server_schema();
  auto loaded = load_env(schema, fake_env({{"API_TOKEN", "s3cr3t-token"}, {"MODE", "dev"}, {"PORT", "+0443"}}));
  auto port = loaded.match([](const env_values& env) { return env.get("PORT").get_or_else(""); },
                           [](const app_error&) { return std::string(); });
  REQUIRE(port == "443");
}

TEST_CASE("load_env: every problem is reported at once", "[config][env]") {
  auto schema = server_schema();
  auto loaded = load_env(schema, fake_env({{"API_TOKEN", "short"}, {"PORT", "99999"}}));
  auto ctx = failure_context(loaded);

  REQUIRE(ctx["issues"].size() == 3);
  REQUIRE(ctx["issues"][0]["path"] == "API_TOKEN");
  REQUIRE(ctx["issues"][0]["message"] == "must be at least 8 characters");
  REQUIRE(ctx["issues"][1]["path"] == "PORT");
  REQUIRE(ctx["issues"][1]["message"] == "must be between 1 and 65535");
  REQUIRE(ctx["issues"][2]["path"] == "MODE");
  REQUIRE(ctx["issues"][2]["message"] == "Required");
  REQUIRE(ctx["missingVariables"] == core::context_map::array({"MODE"}));
}

TEST_CASE("load_env: an empty schema accepts anything", "[config][env]") {
  std::vector<env_var> schema;
  auto loaded = load_env(schema, fake_env({{"IGNORED", "x"}}));
  REQUIRE(loaded.match([](const env_values& env) { return env.size(); }, [](const app_error&) { return std::size_t{99}; }) == 0);
}

TEST_CASE("validators: reasons", "[config][env]") {
  auto reason = [](const result<std::string, std::string>& r) {
    return r.match([](const std::string&) { return std::string("ok"); }, [](const std::string& why) { return why; });
  };
  REQUIRE(reason(validators::non_empty()("")) == "must not be empty");
  REQUIRE(reason(validators::non_empty()("x")) == "ok");
  REQUIRE(reason(validators::one_of({"text", "json"})("yaml")) == "expected one of: text | json");
  REQUIRE(reason(validators::integer_in(0, 10)("ten")) == "expected an integer");
  REQUIRE(reason(validators::integer_in(0, 10)("10")) == "ok");
  REQUIRE(reason(validators::integer_in(0, 10)("1e3")) == "expected an integer");
  REQUIRE(reason(validators::integer_in(-10, 10)("+-5")) == "expected an integer");
  REQUIRE(reason(validators::integer_in(-10, 10)("++5")) == "expected an integer");
  REQUIRE(reason(validators::integer_in(-10, 10)("-5")) == "ok");
}

TEST_CASE("load_env: reads the process environment by default", "[config][env]") {
  set_env_var("CONTRACTS_TEST_ENV_TOKEN", "long-enough-token");
  set_env_var("CONTRACTS_TEST_ENV_PORT", "+9090");
  unset_env_var("CONTRACTS_TEST_ENV_REGION");
  const std::vector<env_var> schema{
      {"CONTRACTS_TEST_ENV_TOKEN", true, std::nullopt, validators::min_length(8)},
      {"CONTRACTS_TEST_ENV_PORT", true, std::nullopt, validators::integer_in(1, 65535)},
      {"CONTRACTS_TEST_ENV_REGION", false, std::string("eu-west"), {}},
  };

  auto loaded = load_env(schema);
  loaded.match(
      [](const env_values& env) {
        REQUIRE(env.get("CONTRACTS_TEST_ENV_TOKEN") == some(std::string("long-enough-token")));
        REQUIRE(env.get_int("CONTRACTS_TEST_ENV_PORT") == some(9090LL));
        REQUIRE(env.get("CONTRACTS_TEST_ENV_REGION") == some(std::string("eu-west")));
      },
      [](const app_error& e) { FAIL(core::format_for_developers(e)); });

  unset_env_var("CONTRACTS_TEST_ENV_TOKEN");
  unset_env_var("CONTRACTS_TEST_ENV_PORT");
}

TEST_CASE("load_env: unset process variables are reported as missing", "[config][env]") {
  unset_env_var("CONTRACTS_TEST_ENV_MISSING");
  const std::vector<env_var> schema{{"CONTRACTS_TEST_ENV_MISSING", true, std::nullopt, {}}};
  auto ctx = failure_context(load_env(schema));
  REQUIRE(ctx["missingVariables"] == core::context_map::array({"CONTRACTS_TEST_ENV_MISSING"}));
  REQUIRE(ctx["issues"][0]["message"] == "Required");
}

TEST_CASE("load_env: an empty process variable is set, not missing", "[config][env]") {
  set_env_var("CONTRACTS_TEST_ENV_EMPTY", "");
  const std::vector<env_var> schema{{"CONTRACTS_TEST_ENV_EMPTY", true, std::nullopt, validators::non_empty()}};
  auto ctx = failure_context(load_env(schema));
#if defined(_WIN32)
  // the Windows CRT removes a variable set to empty
  REQUIRE(ctx["issues"][0]["message"] == "Required");
#else
  REQUIRE(ctx["issues"][0]["message"] == "must not be empty");
  REQUIRE(ctx["missingVariables"].empty());
#endif
  unset_env_var("CONTRACTS_TEST_ENV_EMPTY");
}

TEST_CASE("safe_getenv: null and empty names are never looked up", "[config][env]") {
  REQUIRE_FALSE(safe_getenv(nullptr).has_value());
  REQUIRE_FALSE(safe_getenv("").has_value());
}
