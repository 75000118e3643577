#pragma once

/** \file branded.hpp
 *  \brief Nominal wrappers over primitive values, built only through validating factories.
 *
 * A branded<T, Tag> holds a T that has passed the Tag's check. Two brands over
 * the same T do not convert into each other, so a user_id cannot be passed where
 * an email is expected. Factories return result<branded<...>>; every rejection
 * is a VALIDATION app_error whose context names the offending input.
 */

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "contracts/error.hpp"
#include "contracts/result.hpp"

namespace contracts {

namespace detail {
template <typename Branded> struct brand_access;
}

/** \brief A T that carries proof of validation in its type. */
template <typename T, typename Tag> class branded {
public:
  using value_type = T;
  using tag_type = Tag;

  [[nodiscard]] auto value() const noexcept -> const T& { return value_; }
  explicit operator const T&() const noexcept { return value_; }

  friend auto operator==(const branded&, const branded&) -> bool = default;

private:
  explicit branded(T value) : value_(std::move(value)) {}

  friend struct detail::brand_access<branded>;

  T value_;
};

namespace detail {
/** \brief The only way for library factories to mint a brand. */
template <typename Branded> struct brand_access {
  static auto mint(typename Branded::value_type value) -> Branded { return Branded(std::move(value)); }
};
} // namespace detail

namespace brands {
struct user_id {};
struct email {};
struct non_empty_string {};
struct positive_integer {};
struct non_negative_integer {};
struct url {};
struct uuid {};
struct percentage {};
struct timestamp {}; // Unix time in milliseconds
} // namespace brands

using user_id = branded<std::string, brands::user_id>;
using email = branded<std::string, brands::email>;
using non_empty_string = branded<std::string, brands::non_empty_string>;
using positive_integer = branded<std::int64_t, brands::positive_integer>;
using non_negative_integer = branded<std::int64_t, brands::non_negative_integer>;
using url = branded<std::string, brands::url>;
using uuid = branded<std::string, brands::uuid>;
using percentage = branded<double, brands::percentage>;
using timestamp = branded<std::int64_t, brands::timestamp>;

/** \brief Letters, digits, '_' and '-' only. */
auto make_user_id(std::string_view id) -> result<user_id>;
/** \brief Trimmed and lowercased before the check; the stored value is the normalized form. */
auto make_email(std::string_view address) -> result<email>;
/** \brief Stores the trimmed text. */
auto make_non_empty_string(std::string_view text) -> result<non_empty_string>;
auto make_positive_integer(double value) -> result<positive_integer>;
auto make_non_negative_integer(double value) -> result<non_negative_integer>;
/** \brief Absolute URL with a scheme; http(s), ws(s) and ftp also need a host. */
auto make_url(std::string_view text) -> result<url>;
/** \brief RFC 4122 versions 1-5, any case; stored lowercased. */
auto make_uuid(std::string_view text) -> result<uuid>;
/** \brief Inclusive range [0, 100]. */
auto make_percentage(double value) -> result<percentage>;
/** \brief Positive whole milliseconds. */
auto make_timestamp(double value) -> result<timestamp>;

/**
 * \brief Factory for a custom brand: values rejected by \p validator fail with
 * \p message and {"providedValue": value} when T is JSON-representable.
 */
template <typename T, typename Tag>
auto make_branded(std::function<bool(const T&)> validator, std::string message)
    -> std::function<result<branded<T, Tag>>(T)> {
  return [validator = std::move(validator), message = std::move(message)](T value) -> result<branded<T, Tag>> {
    if (!validator(value)) {
      core::context_map context = core::context_map::object();
      if constexpr (std::is_constructible_v<core::context_map, const T&>) context["providedValue"] = value;
      return failure<branded<T, Tag>>(core::make_error(core::error_kind::validation, message, std::move(context)));
    }
    return success(detail::brand_access<branded<T, Tag>>::mint(std::move(value)));
  };
}

} // namespace contracts
