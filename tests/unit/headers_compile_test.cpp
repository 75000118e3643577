#include <contracts/async_result.hpp>
#include <contracts/boundary.hpp>
#include <contracts/branded.hpp>
#include <contracts/env.hpp>
#include <contracts/error.hpp>
#include <contracts/error_json.hpp>
#include <contracts/error_mapping.hpp>
#include <contracts/option.hpp>
#include <contracts/remote_data.hpp>
#include <contracts/result.hpp>
#include <contracts/throwable.hpp>
#include <catch2/catch.hpp>

#include <type_traits>

TEST_CASE("headers compile and basic types exist", "[headers]") {
  STATIC_REQUIRE(std::is_same_v<contracts::result<int>::error_type, contracts::core::app_error>);
  STATIC_REQUIRE(std::is_same_v<contracts::async_result<int>::result_type, contracts::result<int>>);
  STATIC_REQUIRE_FALSE(std::is_default_constructible_v<contracts::result<int>>);
  STATIC_REQUIRE_FALSE(std::is_default_constructible_v<contracts::option<int>>);
  STATIC_REQUIRE(std::is_nothrow_move_constructible_v<contracts::option<int>>);
  contracts::http_response r{};
  REQUIRE(r.status == 200);
}
