#pragma once

/** \file option.hpp
 *  \brief Opaque presence/absence type: Some(value) | None.
 *
 * The payload is reachable only through match() and the combinators below; there
 * is no has_value()/operator* pair that would allow an unguarded read.
 * Values are immutable after construction and safe to share across threads when T is.
 */

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace contracts {

template <typename T> class [[nodiscard]] option;

namespace detail {
template <typename> struct is_option : std::false_type {};
template <typename T> struct is_option<option<T>> : std::true_type {};
} // namespace detail

template <typename T>
class [[nodiscard]] option {
  static_assert(!std::is_reference_v<T>, "option<T&> is not supported; use option<T*> or a copy");
  static_assert(!std::is_void_v<T>, "option<void> is not supported");

public:
  using value_type = T;

  static auto some(T value) -> option { return option(std::in_place, std::move(value)); }
  static auto none() noexcept -> option { return option(); }

  /** \brief Run exactly one handler: on_some(value) or on_none(). */
  template <typename OnSome, typename OnNone>
  auto match(OnSome&& on_some, OnNone&& on_none) const&
      -> std::common_type_t<std::invoke_result_t<OnSome, const T&>, std::invoke_result_t<OnNone>> {
    if (value_) return std::invoke(std::forward<OnSome>(on_some), *value_);
    return std::invoke(std::forward<OnNone>(on_none));
  }

  template <typename OnSome, typename OnNone>
  auto match(OnSome&& on_some, OnNone&& on_none) &&
      -> std::common_type_t<std::invoke_result_t<OnSome, T&&>, std::invoke_result_t<OnNone>> {
    if (value_) return std::invoke(std::forward<OnSome>(on_some), std::move(*value_));
    return std::invoke(std::forward<OnNone>(on_none));
  }

  template <typename F>
  auto map(F&& f) const& -> option<std::remove_cvref_t<std::invoke_result_t<F, const T&>>> {
    using U = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
    if (value_) return option<U>::some(std::invoke(std::forward<F>(f), *value_));
    return option<U>::none();
  }

  template <typename F>
  auto map(F&& f) && -> option<std::remove_cvref_t<std::invoke_result_t<F, T&&>>> {
    using U = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
    if (value_) return option<U>::some(std::invoke(std::forward<F>(f), std::move(*value_)));
    return option<U>::none();
  }

  /** \brief f: T -> option<U>; the result is not nested. */
  template <typename F>
  auto flat_map(F&& f) const& -> std::remove_cvref_t<std::invoke_result_t<F, const T&>> {
    using R = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
    static_assert(detail::is_option<R>::value, "flat_map requires a function returning option<U>");
    if (value_) return std::invoke(std::forward<F>(f), *value_);
    return R::none();
  }

  template <typename F>
  auto flat_map(F&& f) && -> std::remove_cvref_t<std::invoke_result_t<F, T&&>> {
    using R = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
    static_assert(detail::is_option<R>::value, "flat_map requires a function returning option<U>");
    if (value_) return std::invoke(std::forward<F>(f), std::move(*value_));
    return R::none();
  }

  /** \brief Some(v) stays Some(v) only if pred(v) holds. */
  template <typename Pred>
  auto filter(Pred&& pred) const& -> option {
    if (value_ && std::invoke(std::forward<Pred>(pred), std::as_const(*value_))) return *this;
    return none();
  }

  template <typename Pred>
  auto filter(Pred&& pred) && -> option {
    if (value_ && std::invoke(std::forward<Pred>(pred), std::as_const(*value_))) return std::move(*this);
    return none();
  }

  /** \brief Some((a, b)) only when both are Some. */
  template <typename U>
  auto zip(const option<U>& other) const& -> option<std::pair<T, U>> {
    return flat_map([&other](const T& a) {
      return other.map([&a](const U& b) { return std::pair<T, U>(a, b); });
    });
  }

  template <typename F>
  auto tap(F&& f) const& -> option {
    if (value_) std::invoke(std::forward<F>(f), std::as_const(*value_));
    return *this;
  }

  template <typename F>
  auto tap(F&& f) && -> option {
    if (value_) std::invoke(std::forward<F>(f), std::as_const(*value_));
    return std::move(*this);
  }

  auto get_or_else(T fallback) const& -> T { return value_ ? *value_ : std::move(fallback); }
  auto get_or_else(T fallback) && -> T { return value_ ? std::move(*value_) : std::move(fallback); }

  /** \brief Like get_or_else, but the fallback is computed only on None. */
  template <typename F>
  auto get_or_else_with(F&& f) const& -> T {
    if (value_) return *value_;
    return std::invoke(std::forward<F>(f));
  }

  /** \brief f: () -> option<T>, consulted only on None. */
  template <typename F>
  auto or_else(F&& f) const& -> option {
    if (value_) return *this;
    return std::invoke(std::forward<F>(f));
  }

  /**
   * \brief Boundary-only escape hatch.
   * \throws std::bad_optional_access on None.
   */
  auto get_or_throw() const& -> const T& {
    if (!value_) throw std::bad_optional_access();
    return *value_;
  }

  auto get_or_throw() && -> T {
    if (!value_) throw std::bad_optional_access();
    return std::move(*value_);
  }

  friend bool operator==(const option&, const option&) = default;

private:
  option() = default;
  template <typename... Args>
  explicit option(std::in_place_t, Args&&... args) : value_(std::in_place, std::forward<Args>(args)...) {}

  std::optional<T> value_;
};

template <typename T>
auto some(T&& value) -> option<std::decay_t<T>> {
  return option<std::decay_t<T>>::some(std::forward<T>(value));
}

template <typename T>
auto none() noexcept -> option<T> {
  return option<T>::none();
}

/** \brief Lift a std::optional produced by legacy code. */
template <typename T>
auto from_optional(std::optional<T> value) -> option<T> {
  if (value) return option<T>::some(std::move(*value));
  return option<T>::none();
}

/** \brief Lift a nullable pointer; the pointee is copied. */
template <typename T>
auto from_nullable(const T* value) -> option<std::remove_cv_t<T>> {
  if (value != nullptr) return option<std::remove_cv_t<T>>::some(*value);
  return option<std::remove_cv_t<T>>::none();
}

} // namespace contracts
