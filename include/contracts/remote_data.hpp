#pragma once

/**
 * \file remote_data.hpp
 * \brief Four-state lifecycle for data fetched asynchronously (UI/service state machines).
 *
 *   NotAsked -> Loading -> Success(T) | Failure(E)
 *   Success  -> Loading          (refetch)
 *   Failure  -> Loading          (retry)
 *
 * Transitions are encoded in the types. remote_data exposes to_loading() and
 * nothing else; only remote_loading, the in-flight state, can become Success or
 * Failure. NotAsked -> Success and Success -> Failure therefore do not compile.
 * match() takes all four handlers; there is no default branch.
 */

#include <functional>
#include <type_traits>
#include <utility>
#include <variant>

#include "contracts/error.hpp"
#include "contracts/option.hpp"
#include "contracts/result.hpp"

namespace contracts {

template <typename T, typename E = core::app_error> class [[nodiscard]] remote_data;
template <typename T, typename E = core::app_error> class [[nodiscard]] remote_loading;

template <typename T, typename E>
class [[nodiscard]] remote_data {
  static constexpr std::size_t kNotAsked = 0;
  static constexpr std::size_t kLoading = 1;
  static constexpr std::size_t kSuccess = 2;
  static constexpr std::size_t kFailure = 3;

  struct not_asked_state { friend bool operator==(not_asked_state, not_asked_state) = default; };
  struct loading_state { friend bool operator==(loading_state, loading_state) = default; };

public:
  using value_type = T;
  using error_type = E;

  /** \brief The only legal initial state. */
  static auto not_asked() -> remote_data { return remote_data(std::in_place_index<kNotAsked>); }

  /** \brief A concluded computation: Success -> Success, Failure -> Failure. */
  static auto from_result(result<T, E> r) -> remote_data {
    return std::move(r).match(
        [](T&& v) { return remote_data(std::in_place_index<kSuccess>, std::move(v)); },
        [](E&& e) { return remote_data(std::in_place_index<kFailure>, std::move(e)); });
  }

  /** \brief Start (or restart) a fetch. Legal from every state. */
  auto to_loading() const -> remote_loading<T, E> { return remote_loading<T, E>(); }

  /** \brief Exhaustive: every caller handles "not yet asked" and "in flight". */
  template <typename OnNotAsked, typename OnLoading, typename OnSuccess, typename OnFailure>
  auto match(OnNotAsked&& on_not_asked, OnLoading&& on_loading, OnSuccess&& on_success,
             OnFailure&& on_failure) const&
      -> std::common_type_t<std::invoke_result_t<OnNotAsked>, std::invoke_result_t<OnLoading>,
                            std::invoke_result_t<OnSuccess, const T&>,
                            std::invoke_result_t<OnFailure, const E&>> {
    switch (state_.index()) {
      case kNotAsked: return std::invoke(std::forward<OnNotAsked>(on_not_asked));
      case kLoading: return std::invoke(std::forward<OnLoading>(on_loading));
      case kSuccess: return std::invoke(std::forward<OnSuccess>(on_success), std::get<kSuccess>(state_));
      default: return std::invoke(std::forward<OnFailure>(on_failure), std::get<kFailure>(state_));
    }
  }

  template <typename F>
  auto map(F&& f) const& -> remote_data<std::remove_cvref_t<std::invoke_result_t<F, const T&>>, E> {
    using U = std::remove_cvref_t<std::invoke_result_t<F, const T&>>;
    using out = remote_data<U, E>;
    switch (state_.index()) {
      case kNotAsked: return out::not_asked();
      case kLoading: return out(std::in_place_index<kLoading>);
      case kSuccess:
        return out(std::in_place_index<kSuccess>, std::invoke(std::forward<F>(f), std::get<kSuccess>(state_)));
      default: return out(std::in_place_index<kFailure>, std::get<kFailure>(state_));
    }
  }

  template <typename F>
  auto map_error(F&& f) const& -> remote_data<T, std::remove_cvref_t<std::invoke_result_t<F, const E&>>> {
    using E2 = std::remove_cvref_t<std::invoke_result_t<F, const E&>>;
    using out = remote_data<T, E2>;
    switch (state_.index()) {
      case kNotAsked: return out::not_asked();
      case kLoading: return out(std::in_place_index<kLoading>);
      case kSuccess: return out(std::in_place_index<kSuccess>, std::get<kSuccess>(state_));
      default:
        return out(std::in_place_index<kFailure>, std::invoke(std::forward<F>(f), std::get<kFailure>(state_)));
    }
  }

  /** \brief The data on Success; fallback in the three other states. */
  auto get_or_else(T fallback) const -> T {
    if (state_.index() == kSuccess) return std::get<kSuccess>(state_);
    return fallback;
  }

  auto to_option() const -> option<T> {
    if (state_.index() == kSuccess) return option<T>::some(std::get<kSuccess>(state_));
    return option<T>::none();
  }

  friend bool operator==(const remote_data&, const remote_data&) = default;

private:
  template <typename, typename> friend class remote_data;
  friend class remote_loading<T, E>;

  template <std::size_t I, typename... Args>
  explicit remote_data(std::in_place_index_t<I> tag, Args&&... args) : state_(tag, std::forward<Args>(args)...) {}

  std::variant<not_asked_state, loading_state, T, E> state_;
};

/**
 * \brief The in-flight state. Resolves into Success or Failure, or is viewed as a
 * remote_data in the Loading state.
 */
template <typename T, typename E>
class [[nodiscard]] remote_loading {
public:
  auto to_success(T data) const -> remote_data<T, E> {
    return remote_data<T, E>(std::in_place_index<2>, std::move(data));
  }

  auto to_failure(E error) const -> remote_data<T, E> {
    return remote_data<T, E>(std::in_place_index<3>, std::move(error));
  }

  /** \brief Conclude with the outcome of the fetch. */
  auto resolve(result<T, E> outcome) const -> remote_data<T, E> {
    return remote_data<T, E>::from_result(std::move(outcome));
  }

  /** \brief This state as a remote_data, e.g. to store it while the fetch runs. */
  auto as_remote_data() const -> remote_data<T, E> { return remote_data<T, E>(std::in_place_index<1>); }

  operator remote_data<T, E>() const { return as_remote_data(); }

  template <typename OnNotAsked, typename OnLoading, typename OnSuccess, typename OnFailure>
  auto match(OnNotAsked&& on_not_asked, OnLoading&& on_loading, OnSuccess&& on_success,
             OnFailure&& on_failure) const {
    return as_remote_data().match(std::forward<OnNotAsked>(on_not_asked), std::forward<OnLoading>(on_loading),
                                  std::forward<OnSuccess>(on_success), std::forward<OnFailure>(on_failure));
  }

private:
  friend class remote_data<T, E>;
  remote_loading() = default;
};

template <typename T, typename E = core::app_error>
auto not_asked() -> remote_data<T, E> {
  return remote_data<T, E>::not_asked();
}

template <typename T, typename E>
auto from_result(result<T, E> r) -> remote_data<T, E> {
  return remote_data<T, E>::from_result(std::move(r));
}

} // namespace contracts
