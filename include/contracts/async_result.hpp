#pragma once

/**
 * \file async_result.hpp
 * \brief A deferred computation that resolves to result<T, E>, layered on std::future.
 *
 * Semantics:
 * - get() never throws and never yields a bare T: a stored exception, a broken
 *   promise, an invalid future or a stop request is folded into a failure through
 *   error_traits<E>.
 * - Combinators build continuations with std::launch::deferred. They introduce no
 *   threads; a chain a.flat_map_async(f).flat_map_async(g) resolves a, then f's
 *   result, then g's, in that order, on the thread that calls get().
 * - Cancellation belongs to the host: pass a std::stop_token. Every stage of a
 *   chain shares one token slot, so a token attached to the outermost handle
 *   reaches the producer wait and every future returned by a step. A stop request
 *   makes the pending step resolve to error_traits<E>::cancelled(). The producer
 *   should observe the same token; a std::async producer is still joined when its
 *   future is released.
 * - No timeout policy: wrap the producer future before lifting it.
 *
 * Thread-safety: an async_result is a single-consumer handle (move-only, like
 * std::future). Its resolved result is an immutable value.
 */

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>
#include <type_traits>
#include <utility>
#include <vector>

#include "contracts/error.hpp"
#include "contracts/result.hpp"
#include "contracts/throwable.hpp"

namespace contracts {

template <typename T, typename E = core::app_error> class [[nodiscard]] async_result;

namespace detail {

template <typename> struct is_async_result : std::false_type {};
template <typename T, typename E> struct is_async_result<async_result<T, E>> : std::true_type {};

template <typename> struct is_future : std::false_type {};
template <typename V> struct is_future<std::future<V>> : std::true_type {};

template <typename X> struct future_value { using type = X; };
template <typename V> struct future_value<std::future<V>> { using type = V; };

// Poll granularity while waiting on a stoppable future.
inline constexpr std::chrono::milliseconds stop_poll_interval{2};

// Wait for f unless stop is requested first. Deferred futures report ready.
template <typename V>
auto wait_or_stop(const std::future<V>& f, const std::stop_token& stop) -> bool {
  if (!stop.stop_possible()) return true;
  if (stop.stop_requested()) return false;
  while (f.wait_for(stop_poll_interval) == std::future_status::timeout) {
    if (stop.stop_requested()) return false;
  }
  return true;
}

} // namespace detail

template <typename T, typename E>
class [[nodiscard]] async_result {
public:
  using value_type = T;
  using error_type = E;
  using result_type = result<T, E>;

  /** \brief An already resolved computation. */
  static auto ready(result_type r) -> async_result {
    std::promise<result_type> p;
    p.set_value(std::move(r));
    return async_result(p.get_future(), std::make_shared<std::stop_token>());
  }

  static auto from_future(std::future<result_type> future, std::stop_token stop = {}) -> async_result {
    return async_result(std::move(future), std::make_shared<std::stop_token>(std::move(stop)));
  }

  /**
   * \brief Lift a plain std::future<T>; a stored exception becomes a failure.
   * The wait on future observes the chain's token, including one attached later.
   */
  static auto from_value_future(std::future<T> future, std::stop_token stop = {}) -> async_result {
    auto slot = std::make_shared<std::stop_token>(std::move(stop));
    auto lifted = std::async(std::launch::deferred,
                             [future = std::move(future), slot]() mutable -> result_type {
                               if (!detail::wait_or_stop(future, *slot)) {
                                 return result_type::failure(error_traits<E>::cancelled("operation cancelled"));
                               }
                               return result_type::success(future.get());
                             });
    return async_result(std::move(lifted), std::move(slot));
  }

  /** \brief Attach a stop token to this handle and every stage it was built from. */
  auto with_stop_token(std::stop_token stop) && -> async_result {
    if (!stop_) stop_ = std::make_shared<std::stop_token>();
    *stop_ = std::move(stop);
    return std::move(*this);
  }

  [[nodiscard]] auto valid() const noexcept -> bool { return future_.valid(); }

  /** \brief Block until resolved; a deferred chain runs on the calling thread. */
  void wait() const {
    if (future_.valid()) future_.wait();
  }

  /** \brief Resolve. Consumes the handle; never throws. */
  auto get() && -> result_type {
    using traits = error_traits<E>;
    const std::stop_token stop = stop_ ? *stop_ : std::stop_token{};
    if (stop.stop_requested()) return result_type::failure(traits::cancelled("operation cancelled"));
    if (!future_.valid()) {
      return result_type::failure(
          traits::from_exception(std::make_exception_ptr(std::future_error(std::future_errc::no_state))));
    }
    if (!detail::wait_or_stop(future_, stop)) return result_type::failure(traits::cancelled("operation cancelled"));
    try {
      return future_.get();
    } catch (...) {
      return result_type::failure(traits::from_exception(std::current_exception()));
    }
  }

  /** \brief f: T -> U or T -> std::future<U>. */
  template <typename F>
  auto map_async(F&& f) && {
    using R = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
    using U = typename detail::future_value<R>::type;
    return std::move(*this).template then<U, E>(
        [f = std::forward<F>(f)](result_type prev, const std::stop_token& stop) mutable -> result<U, E> {
          return std::move(prev).flat_map([&](T&& v) -> result<U, E> {
            if constexpr (detail::is_future<R>::value) {
              auto pending = std::invoke(f, std::move(v));
              if (!detail::wait_or_stop(pending, stop)) {
                return result<U, E>::failure(error_traits<E>::cancelled("operation cancelled"));
              }
              return result<U, E>::success(pending.get());
            } else {
              return result<U, E>::success(std::invoke(f, std::move(v)));
            }
          });
        });
  }

  /** \brief f: T -> result<U, E>, async_result<U, E> or std::future<result<U, E>>. */
  template <typename F>
  auto flat_map_async(F&& f) && {
    using R = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
    using Inner = typename detail::future_value<R>::type;
    static_assert(detail::is_result<Inner>::value || detail::is_async_result<Inner>::value,
                  "flat_map_async requires a function returning result, async_result or std::future<result>");
    using U = typename Inner::value_type;
    static_assert(std::is_same_v<typename Inner::error_type, E>, "flat_map_async cannot change the error type");
    return std::move(*this).template then<U, E>(
        [f = std::forward<F>(f)](result_type prev, const std::stop_token& stop) mutable -> result<U, E> {
          return std::move(prev).flat_map([&](T&& v) -> result<U, E> {
            if constexpr (detail::is_future<R>::value) {
              return async_result<U, E>::from_future(std::invoke(f, std::move(v)), stop).get();
            } else if constexpr (detail::is_async_result<R>::value) {
              auto inner = std::invoke(f, std::move(v));
              if (stop.stop_possible()) inner = std::move(inner).with_stop_token(stop);
              return std::move(inner).get();
            } else {
              return std::invoke(f, std::move(v));
            }
          });
        });
  }

  /** \brief f: const T& -> void or std::future<void>; the value passes through unchanged. */
  template <typename F>
  auto tap_async(F&& f) && -> async_result {
    using R = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
    return std::move(*this).template then<T, E>(
        [f = std::forward<F>(f)](result_type prev, const std::stop_token& stop) mutable -> result_type {
          return std::move(prev).flat_map([&](T&& v) -> result_type {
            if constexpr (detail::is_future<R>::value) {
              auto pending = std::invoke(f, std::as_const(v));
              if (!detail::wait_or_stop(pending, stop)) {
                return result_type::failure(error_traits<E>::cancelled("operation cancelled"));
              }
              pending.get();
            } else {
              std::invoke(f, std::as_const(v));
            }
            return result_type::success(std::move(v));
          });
        });
  }

  /** \brief f: E -> E2 or E -> std::future<E2>. */
  template <typename F>
  auto map_error_async(F&& f) && {
    using R = std::remove_cvref_t<std::invoke_result_t<F, E&&>>;
    using E2 = typename detail::future_value<R>::type;
    return std::move(*this).template then<T, E2>(
        [f = std::forward<F>(f)](result_type prev, const std::stop_token& stop) mutable -> result<T, E2> {
          return std::move(prev).match(
              [](T&& v) { return result<T, E2>::success(std::move(v)); },
              [&](E&& e) -> result<T, E2> {
                if constexpr (detail::is_future<R>::value) {
                  auto pending = std::invoke(f, std::move(e));
                  if (!detail::wait_or_stop(pending, stop)) {
                    return result<T, E2>::failure(error_traits<E2>::cancelled("operation cancelled"));
                  }
                  return result<T, E2>::failure(pending.get());
                } else {
                  return result<T, E2>::failure(std::invoke(f, std::move(e)));
                }
              });
        });
  }

private:
  template <typename, typename> friend class async_result;
  template <typename U, typename E2>
  friend auto all_async(std::vector<async_result<U, E2>> pending) -> async_result<std::vector<U>, E2>;

  async_result(std::future<result_type> future, std::shared_ptr<std::stop_token> stop)
      : future_(std::move(future)), stop_(std::move(stop)) {}

  // Deferred continuation: resolve this, then run step(result, token) on the
  // resolved result. The new handle shares this chain's token slot.
  // Anything step throws becomes a failure of the new chain.
  template <typename U, typename E2, typename Step>
  auto then(Step step) && -> async_result<U, E2> {
    if (!stop_) stop_ = std::make_shared<std::stop_token>();
    auto slot = stop_;
    auto next = std::async(std::launch::deferred,
                           [self = std::move(*this), step = std::move(step)]() mutable -> result<U, E2> {
                             const std::stop_token stop = *self.stop_;
                             auto prev = std::move(self).get();
                             try {
                               return step(std::move(prev), stop);
                             } catch (...) {
                               return result<U, E2>::failure(
                                   error_traits<E2>::from_exception(std::current_exception()));
                             }
                           });
    return async_result<U, E2>(std::move(next), std::move(slot));
  }

  std::future<result_type> future_;
  std::shared_ptr<std::stop_token> stop_; // shared by every stage of one chain
};

/**
 * \brief Async from_throwable: run fn under the given launch policy.
 * A failure to launch (e.g. no thread available) is itself a failure.
 */
template <typename F>
auto from_throwable_async(F&& fn, std::launch policy = std::launch::async, std::stop_token stop = {}) {
  using R = decltype(from_throwable(std::declval<std::decay_t<F>&>()));
  using T = typename R::value_type;
  using out = async_result<T, core::app_error>;
  try {
    return out::from_future(std::async(policy,
                                       [fn = std::forward<F>(fn)]() mutable -> R {
                                         return from_throwable(fn);
                                       }),
                            std::move(stop));
  } catch (...) {
    return out::ready(R::failure(core::to_app_error(std::current_exception())));
  }
}

/**
 * \brief Await every pending result in order, then combine: all values or the first failure.
 * A token attached to the combined handle is passed to each pending result.
 */
template <typename T, typename E>
auto all_async(std::vector<async_result<T, E>> pending) -> async_result<std::vector<T>, E> {
  auto slot = std::make_shared<std::stop_token>();
  auto combined = std::async(
      std::launch::deferred, [pending = std::move(pending), slot]() mutable -> result<std::vector<T>, E> {
        const std::stop_token stop = *slot;
        std::vector<result<T, E>> resolved;
        resolved.reserve(pending.size());
        for (auto& p : pending) {
          if (stop.stop_possible()) p = std::move(p).with_stop_token(stop);
          resolved.push_back(std::move(p).get());
        }
        return all(resolved);
      });
  return async_result<std::vector<T>, E>(std::move(combined), std::move(slot));
}

} // namespace contracts
