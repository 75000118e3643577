#pragma once

/**
 * \file result.hpp
 * \brief Opaque success/failure type: Success(data) | Failure(error).
 *
 * Design:
 * - Storage is a private std::expected<T, E>; nothing exposes has_value() or
 *   operator*, so a success value cannot be read out of a failure (or vice versa).
 *   match() is the sole extractor.
 * - Construction only through success()/failure() (and from_expected() for
 *   std::expected producers).
 * - The class is [[nodiscard]]: a result dropped without being consumed is a
 *   compiler diagnostic.
 * - get_or_throw() is the one unsafe escape and is reserved for outermost
 *   boundaries that cannot return a result (constructors, main()).
 *
 * Laws: flat_map is associative; map(identity) == identity; map/flat_map never
 * invoke their function on a failure, map_error/tap_error never on a success.
 */

#include <expected>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "contracts/error.hpp"
#include "contracts/option.hpp"

namespace contracts {

/** \brief Payload of a computation that succeeds with no value. */
using unit = std::monostate;

template <typename T, typename E = core::app_error> class [[nodiscard]] result;

namespace detail {
template <typename> struct is_result : std::false_type {};
template <typename T, typename E> struct is_result<result<T, E>> : std::true_type {};
} // namespace detail

template <typename T, typename E>
class [[nodiscard]] result {
  static_assert(!std::is_reference_v<T> && !std::is_reference_v<E>, "result does not hold references");
  static_assert(!std::is_void_v<T>, "use result<unit, E> for computations without a value");

public:
  using value_type = T;
  using error_type = E;

  static auto success(T data) -> result {
    return result(std::expected<T, E>(std::in_place, std::move(data)));
  }
  static auto failure(E error) -> result {
    return result(std::expected<T, E>(std::unexpect, std::move(error)));
  }
  /** \brief Lift a std::expected returned by lower layers. */
  static auto from_expected(std::expected<T, E> state) -> result { return result(std::move(state)); }

  /** \brief Run exactly one handler and return its value. */
  template <typename OnSuccess, typename OnFailure>
  auto match(OnSuccess&& on_success, OnFailure&& on_failure) const&
      -> std::common_type_t<std::invoke_result_t<OnSuccess, const T&>,
                            std::invoke_result_t<OnFailure, const E&>> {
    if (state_) return std::invoke(std::forward<OnSuccess>(on_success), *state_);
    return std::invoke(std::forward<OnFailure>(on_failure), state_.error());
  }

  template <typename OnSuccess, typename OnFailure>
  auto match(OnSuccess&& on_success, OnFailure&& on_failure) &&
      -> std::common_type_t<std::invoke_result_t<OnSuccess, T&&>,
                            std::invoke_result_t<OnFailure, E&&>> {
    if (state_) return std::invoke(std::forward<OnSuccess>(on_success), std::move(*state_));
    return std::invoke(std::forward<OnFailure>(on_failure), std::move(state_).error());
  }

  template <typename F>
  auto map(F&& f) const& -> result<std::remove_cvref_t<std::invoke_result_t<F, const T&>>, E> {
    using U = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
    if (state_) return result<U, E>::success(std::invoke(std::forward<F>(f), *state_));
    return result<U, E>::failure(state_.error());
  }

  template <typename F>
  auto map(F&& f) && -> result<std::remove_cvref_t<std::invoke_result_t<F, T&&>>, E> {
    using U = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
    if (state_) return result<U, E>::success(std::invoke(std::forward<F>(f), std::move(*state_)));
    return result<U, E>::failure(std::move(state_).error());
  }

  template <typename F>
  auto map_error(F&& f) const& -> result<T, std::remove_cvref_t<std::invoke_result_t<F, const E&>>> {
    using E2 = std::remove_cvref_t<std::invoke_result_t<F, const E&>>;
    if (state_) return result<T, E2>::success(*state_);
    return result<T, E2>::failure(std::invoke(std::forward<F>(f), state_.error()));
  }

  template <typename F>
  auto map_error(F&& f) && -> result<T, std::remove_cvref_t<std::invoke_result_t<F, E&&>>> {
    using E2 = std::remove_cvref_t<std::invoke_result_t<F, E&&>>;
    if (state_) return result<T, E2>::success(std::move(*state_));
    return result<T, E2>::failure(std::invoke(std::forward<F>(f), std::move(state_).error()));
  }

  /** \brief f: T -> result<U, E>; the returned result is f's, never nested. */
  template <typename F>
  auto flat_map(F&& f) const& -> std::remove_cvref_t<std::invoke_result_t<F, const T&>> {
    using R = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
    static_assert(detail::is_result<R>::value, "flat_map requires a function returning result<U, E>");
    static_assert(std::is_same_v<typename R::error_type, E>, "flat_map cannot change the error type; use map_error");
    if (state_) return std::invoke(std::forward<F>(f), *state_);
    return R::failure(state_.error());
  }

  template <typename F>
  auto flat_map(F&& f) && -> std::remove_cvref_t<std::invoke_result_t<F, T&&>> {
    using R = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
    static_assert(detail::is_result<R>::value, "flat_map requires a function returning result<U, E>");
    static_assert(std::is_same_v<typename R::error_type, E>, "flat_map cannot change the error type; use map_error");
    if (state_) return std::invoke(std::forward<F>(f), std::move(*state_));
    return R::failure(std::move(state_).error());
  }

  /** \brief Recover from a failure: f: E -> result<T, E2>. Successes pass through. */
  template <typename F>
  auto or_else(F&& f) const& -> std::remove_cvref_t<std::invoke_result_t<F, const E&>> {
    using R = std::remove_cvref_t<std::invoke_result_t<F, const E&>>;
    static_assert(detail::is_result<R>::value, "or_else requires a function returning result<T, E2>");
    static_assert(std::is_same_v<typename R::value_type, T>, "or_else cannot change the value type");
    if (state_) return R::success(*state_);
    return std::invoke(std::forward<F>(f), state_.error());
  }

  template <typename F>
  auto tap(F&& f) const& -> result {
    if (state_) std::invoke(std::forward<F>(f), std::as_const(*state_));
    return *this;
  }

  template <typename F>
  auto tap(F&& f) && -> result {
    if (state_) std::invoke(std::forward<F>(f), std::as_const(*state_));
    return std::move(*this);
  }

  template <typename F>
  auto tap_error(F&& f) const& -> result {
    if (!state_) std::invoke(std::forward<F>(f), std::as_const(state_.error()));
    return *this;
  }

  template <typename F>
  auto tap_error(F&& f) && -> result {
    if (!state_) std::invoke(std::forward<F>(f), std::as_const(state_.error()));
    return std::move(*this);
  }

  auto get_or_else(T fallback) const& -> T { return state_ ? *state_ : std::move(fallback); }
  auto get_or_else(T fallback) && -> T { return state_ ? std::move(*state_) : std::move(fallback); }

  /** \brief f: E -> T, computed only on failure. */
  template <typename F>
  auto get_or_else_with(F&& f) const& -> T {
    if (state_) return *state_;
    return std::invoke(std::forward<F>(f), state_.error());
  }

  /**
   * \brief Boundary-only escape hatch.
   * \throws std::bad_expected_access<E> carrying the error on failure.
   */
  auto get_or_throw() const& -> const T& { return state_.value(); }
  auto get_or_throw() && -> T { return std::move(state_).value(); }

  /** \brief Some(data) on success; the error is discarded. */
  auto to_option() const& -> option<T> {
    if (state_) return option<T>::some(*state_);
    return option<T>::none();
  }

  auto to_option() && -> option<T> {
    if (state_) return option<T>::some(std::move(*state_));
    return option<T>::none();
  }

  friend bool operator==(const result&, const result&) = default;

private:
  explicit result(std::expected<T, E> state) : state_(std::move(state)) {}

  std::expected<T, E> state_;
};

template <typename E = core::app_error, typename T>
auto success(T&& data) -> result<std::decay_t<T>, E> {
  return result<std::decay_t<T>, E>::success(std::forward<T>(data));
}

/** \brief Success with no payload. */
template <typename E = core::app_error>
auto success() -> result<unit, E> {
  return result<unit, E>::success(unit{});
}

template <typename T, typename E>
auto failure(E&& error) -> result<T, std::decay_t<E>> {
  return result<T, std::decay_t<E>>::failure(std::forward<E>(error));
}

template <typename T, typename E>
auto from_expected(std::expected<T, E> state) -> result<T, E> {
  return result<T, E>::from_expected(std::move(state));
}

/** \brief Success if the optional is engaged, failure(error) otherwise. */
template <typename T, typename E>
auto from_optional(std::optional<T> value, E error) -> result<T, E> {
  if (value) return result<T, E>::success(std::move(*value));
  return result<T, E>::failure(std::move(error));
}

template <typename T, typename E>
auto ok_or(const option<T>& value, E error) -> result<T, E> {
  return value.match([](const T& v) { return result<T, E>::success(v); },
                     [&error] { return result<T, E>::failure(std::move(error)); });
}

template <typename T, typename E>
auto flatten(const result<result<T, E>, E>& nested) -> result<T, E> {
  return nested.flat_map([](const result<T, E>& inner) { return inner; });
}

/** \brief All values in order, or the first failure. */
template <typename T, typename E>
auto all(const std::vector<result<T, E>>& results) -> result<std::vector<T>, E> {
  std::vector<T> values;
  values.reserve(results.size());
  for (const auto& r : results) {
    auto first_error = r.match(
        [&values](const T& v) -> std::optional<E> { values.push_back(v); return std::nullopt; },
        [](const E& e) -> std::optional<E> { return e; });
    if (first_error) return result<std::vector<T>, E>::failure(std::move(*first_error));
  }
  return result<std::vector<T>, E>::success(std::move(values));
}

template <typename A, typename B, typename E>
auto zip(const result<A, E>& a, const result<B, E>& b) -> result<std::pair<A, B>, E> {
  return a.flat_map([&b](const A& x) {
    return b.map([&x](const B& y) { return std::pair<A, B>(x, y); });
  });
}

} // namespace contracts
