#include <contracts/result.hpp>
#include <catch2/catch.hpp>

#include <expected>
#include <string>
#include <vector>

using namespace contracts;
using contracts::core::app_error;
using contracts::core::error_kind;
using contracts::core::make_error;

static auto code_of(const result<int>& r) -> std::string {
  return r.match([](int) { return std::string("ok"); },
                 [](const app_error& e) { return std::string(core::to_string(e.code())); });
}

static auto parse_positive(int x) -> result<int> {
  if (x > 0) return success(x);
  return failure<int>(make_error(error_kind::validation, "must be positive", {{"value", x}}));
}

TEST_CASE("result: map then match on success", "[result]") {
  auto out = success(42).map([](int x) { return x + 1; }).match([](int x) { return x; }, [](const app_error&) { return -1; });
  REQUIRE(out == 43);
}

TEST_CASE("result: flat_map short-circuits a failure", "[result]") {
  auto code = failure<int>(make_error(error_kind::not_found, "missing"))
                  .flat_map([](int x) { return success(x); })
                  .match([](int) { return std::string("ok"); },
                         [](const app_error& e) { return std::string(core::to_string(e.code())); });
  REQUIRE(code == "NOT_FOUND");
}

TEST_CASE("result: combinators never run on the other variant", "[result]") {
  int value_calls = 0, error_calls = 0;
  auto on_value = [&value_calls](int x) { ++value_calls; return x; };
  auto on_error = [&error_calls](const app_error& e) { ++error_calls; return e; };

  auto failed = failure<int>(make_error(error_kind::internal, "boom"));
  (void)failed.map(on_value);
  (void)failed.flat_map([&](int x) { return success(on_value(x)); });
  (void)failed.tap([&](const int& x) { on_value(x); });
  REQUIRE(value_calls == 0);

  auto ok = success(1);
  (void)ok.map_error(on_error);
  (void)ok.tap_error([&](const app_error& e) { on_error(e); });
  (void)ok.or_else([&](const app_error& e) { on_error(e); return success(0); });
  REQUIRE(error_calls == 0);
}

TEST_CASE("result: map_error and or_else", "[result]") {
  auto failed = failure<int>(make_error(error_kind::not_found, "missing"));
  auto relabelled = failed.map_error([](const app_error& e) { return core::wrap(error_kind::internal, "lookup failed", e); });
  auto chain = relabelled.match([](int) { return std::vector<std::string>{}; },
                                [](const app_error& e) { return e.cause_chain(); });
  REQUIRE(chain == std::vector<std::string>{"missing"});

  auto recovered = failed.or_else([](const app_error& e) {
    return e.code() == error_kind::not_found ? success(0) : failure<int>(e);
  });
  REQUIRE(recovered == success(0));

  auto as_text = failed.map_error([](const app_error& e) { return e.message(); });
  REQUIRE(as_text == failure<int>(std::string("missing")));
}

TEST_CASE("result: fallbacks and get_or_throw", "[result]") {
  REQUIRE(failure<int>(make_error(error_kind::internal, "x")).get_or_else(7) == 7);
  REQUIRE(success(3).get_or_else(7) == 3);
  REQUIRE(failure<int>(make_error(error_kind::conflict, "x")).get_or_else_with([](const app_error& e) {
            return static_cast<int>(e.code());
          }) == 6002);

  REQUIRE(success(3).get_or_throw() == 3);
  auto failed = failure<int>(make_error(error_kind::forbidden, "nope"));
  try {
    (void)failed.get_or_throw();
    FAIL("get_or_throw must throw on failure");
  } catch (const std::bad_expected_access<app_error>& ex) {
    REQUIRE(ex.error().code() == error_kind::forbidden);
    REQUIRE(ex.error().message() == "nope");
  }
}

TEST_CASE("result: tap observes successes only", "[result]") {
  int seen = 0;
  std::string seen_error;
  auto r = success(5).tap([&](const int& v) { seen = v; }).tap_error([&](const app_error& e) { seen_error = e.message(); });
  REQUIRE(seen == 5);
  REQUIRE(seen_error.empty());
  REQUIRE(r == success(5));
}

TEST_CASE("result: unit payload", "[result]") {
  auto done = success();
  REQUIRE(done.match([](unit) { return true; }, [](const app_error&) { return false; }));
  auto typed = success<std::string>();
  REQUIRE(typed == result<unit, std::string>::success(unit{}));
}

TEST_CASE("result: conversions to and from the standard vocabulary", "[result]") {
  REQUIRE(success(4).to_option() == some(4));
  REQUIRE(failure<int>(make_error(error_kind::internal, "x")).to_option() == none<int>());

  auto from_std = from_expected(std::expected<int, std::string>(std::unexpect, "bad"));
  REQUIRE(from_std == failure<int>(std::string("bad")));

  auto missing = make_error(error_kind::not_found, "no config");
  REQUIRE(code_of(from_optional(std::optional<int>(), missing)) == "NOT_FOUND");
  REQUIRE(code_of(ok_or(some(2), missing)) == "ok");
  REQUIRE(code_of(ok_or(none<int>(), missing)) == "NOT_FOUND");
}

TEST_CASE("result: flatten and zip", "[result]") {
  auto nested = success(success(9));
  REQUIRE(flatten(nested) == success(9));

  auto inner_failed = success(failure<int>(make_error(error_kind::conflict, "x")));
  REQUIRE(code_of(flatten(inner_failed)) == "CONFLICT");

  REQUIRE(zip(success(1), success(std::string("b"))) == success(std::pair<int, std::string>(1, "b")));
  auto failed = zip(parse_positive(1), parse_positive(-1));
  REQUIRE(failed.match([](const auto&) { return std::string("ok"); },
                       [](const app_error& e) { return e.message(); }) == "must be positive");
}

TEST_CASE("result: all collects values or returns the first failure", "[result]") {
  std::vector<result<int>> good{success(1), success(2), success(3)};
  REQUIRE(all(good) == success(std::vector<int>{1, 2, 3}));

  std::vector<result<int>> bad{success(1), parse_positive(-2), parse_positive(-3)};
  auto first = all(bad).match([](const std::vector<int>&) { return app_error(error_kind::internal, "unexpected"); },
                              [](const app_error& e) { return e; });
  REQUIRE(first.context()["value"] == -2);

  REQUIRE(all(std::vector<result<int>>{}) == success(std::vector<int>{}));
}
