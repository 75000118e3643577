#pragma once

/** \file throwable.hpp
 *  \brief The sanctioned crossing points between exception-raising code and result.
 *
 * from_throwable() is the only place exceptions are caught; every caught value
 * becomes an app_error (kind preserved when the exception carries one).
 * error_traits<E> is the seam async_result uses to fold host failures into E.
 */

#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

#include "contracts/error.hpp"
#include "contracts/result.hpp"

namespace contracts::core {

/** \brief Exception that carries an app_error; legacy code throws it to keep the kind. */
class app_exception : public std::runtime_error {
public:
  explicit app_exception(app_error error);

  [[nodiscard]] auto error() const noexcept -> const app_error& { return error_; }

private:
  app_error error_;
};

/**
 * \brief Convert a caught exception into an app_error.
 *
 * - app_exception, std::bad_expected_access<app_error>: the carried error.
 * - std::future_error(broken_promise): cancelled (the producer was abandoned).
 * - other std::exception: internal, what() as message, external cause recorded.
 * - anything else (or a null pointer): internal, "Unknown error occurred".
 */
auto to_app_error(std::exception_ptr ep) -> app_error;

} // namespace contracts::core

namespace contracts {

/** \brief How a host failure (exception or cancellation) becomes an E. Specialize for custom E. */
template <typename E> struct error_traits;

template <> struct error_traits<core::app_error> {
  static auto from_exception(std::exception_ptr ep) -> core::app_error { return core::to_app_error(ep); }
  static auto cancelled(std::string_view reason) -> core::app_error {
    return core::make_error(core::error_kind::cancelled, std::string(reason));
  }
};

template <> struct error_traits<std::string> {
  static auto from_exception(std::exception_ptr ep) -> std::string;
  static auto cancelled(std::string_view reason) -> std::string { return std::string(reason); }
};

namespace detail {

template <typename R> struct throwable_result {
  using type = result<std::conditional_t<std::is_void_v<R>, unit, std::remove_cvref_t<R>>, core::app_error>;
};
template <typename T> struct throwable_result<result<T, core::app_error>> {
  using type = result<T, core::app_error>;
};

} // namespace detail

/**
 * \brief Run fn, turning anything it throws into a failure.
 *
 * fn returning void yields result<unit>; fn already returning result<T> is
 * flattened rather than nested.
 */
template <typename F>
auto from_throwable(F&& fn)
    -> typename detail::throwable_result<std::remove_cvref_t<std::invoke_result_t<F>>>::type {
  using R = std::invoke_result_t<F>;
  using out = typename detail::throwable_result<std::remove_cvref_t<R>>::type;
  try {
    if constexpr (std::is_void_v<R>) {
      std::invoke(std::forward<F>(fn));
      return out::success(unit{});
    } else if constexpr (detail::is_result<std::remove_cvref_t<R>>::value) {
      return std::invoke(std::forward<F>(fn));
    } else {
      return out::success(std::invoke(std::forward<F>(fn)));
    }
  } catch (...) {
    return out::failure(core::to_app_error(std::current_exception()));
  }
}

} // namespace contracts
