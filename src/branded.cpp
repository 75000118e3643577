#include "contracts/branded.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace contracts {

namespace {

const std::regex kUserIdPattern(R"(^[A-Za-z0-9_-]+$)");
const std::regex kEmailPattern(R"(^[^\s@]+@[^\s@]+\.[^\s@]+$)");
const std::regex kUuidPattern(
    R"(^[0-9a-f]{8}-[0-9a-f]{4}-[1-5][0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$)", std::regex::icase);
// scheme ":" then a non-blank remainder without whitespace
const std::regex kUrlPattern(R"(^([A-Za-z][A-Za-z0-9+.\-]*):(\S+)$)");

constexpr double kInt64Limit = 9223372036854775808.0; // 2^63

auto is_space(char c) -> bool { return std::isspace(static_cast<unsigned char>(c)) != 0; }

auto trim(std::string_view text) -> std::string_view {
  while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
  while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
  return text;
}

auto to_lower(std::string_view text) -> std::string {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return out;
}

auto is_whole(double value) -> bool {
  return std::isfinite(value) && std::trunc(value) == value && value > -kInt64Limit && value < kInt64Limit;
}

auto rejected(std::string message, core::context_map context = core::context_map::object()) -> core::app_error {
  return core::make_error(core::error_kind::validation, std::move(message), std::move(context));
}

auto needs_host(std::string_view scheme) -> bool {
  const auto s = to_lower(scheme);
  return s == "http" || s == "https" || s == "ws" || s == "wss" || s == "ftp";
}

template <typename Brand> auto mint(typename Brand::value_type value) -> result<Brand> {
  return success(detail::brand_access<Brand>::mint(std::move(value)));
}

} // namespace

auto make_user_id(std::string_view id) -> result<user_id> {
  if (trim(id).empty()) return failure<user_id>(rejected("User ID cannot be empty"));
  std::string raw(id);
  if (!std::regex_match(raw, kUserIdPattern)) {
    return failure<user_id>(rejected(
        "Invalid user ID format. Only alphanumeric characters, underscores, and hyphens are allowed",
        {{"providedId", raw}}));
  }
  return mint<user_id>(std::move(raw));
}

auto make_email(std::string_view address) -> result<email> {
  auto normalized = to_lower(trim(address));
  if (!std::regex_match(normalized, kEmailPattern)) {
    return failure<email>(rejected("Invalid email format", {{"providedEmail", std::string(address)}}));
  }
  return mint<email>(std::move(normalized));
}

auto make_non_empty_string(std::string_view text) -> result<non_empty_string> {
  auto trimmed = trim(text);
  if (trimmed.empty()) {
    return failure<non_empty_string>(rejected("String cannot be empty or contain only whitespace"));
  }
  return mint<non_empty_string>(std::string(trimmed));
}

auto make_positive_integer(double value) -> result<positive_integer> {
  if (!is_whole(value)) {
    return failure<positive_integer>(rejected("Value must be an integer", {{"providedValue", value}}));
  }
  if (value <= 0) return failure<positive_integer>(rejected("Value must be positive", {{"providedValue", value}}));
  return mint<positive_integer>(static_cast<std::int64_t>(value));
}

auto make_non_negative_integer(double value) -> result<non_negative_integer> {
  if (!is_whole(value)) {
    return failure<non_negative_integer>(rejected("Value must be an integer", {{"providedValue", value}}));
  }
  if (value < 0) {
    return failure<non_negative_integer>(rejected("Value must be non-negative", {{"providedValue", value}}));
  }
  return mint<non_negative_integer>(static_cast<std::int64_t>(value));
}

auto make_url(std::string_view text) -> result<url> {
  std::string raw(text);
  std::smatch parts;
  bool ok = std::regex_match(raw, parts, kUrlPattern);
  if (ok && needs_host(parts[1].str())) {
    const auto rest = parts[2].str();
    ok = rest.size() > 2 && rest.compare(0, 2, "//") == 0 && rest[2] != '/' && rest[2] != '?' && rest[2] != '#';
  }
  if (!ok) return failure<url>(rejected("Invalid URL format", {{"providedUrl", raw}}));
  return mint<url>(std::move(raw));
}

auto make_uuid(std::string_view text) -> result<uuid> {
  std::string raw(text);
  if (!std::regex_match(raw, kUuidPattern)) {
    return failure<uuid>(rejected("Invalid UUID format", {{"providedUuid", raw}}));
  }
  return mint<uuid>(to_lower(raw));
}

auto make_percentage(double value) -> result<percentage> {
  if (!(value >= 0 && value <= 100)) {
    return failure<percentage>(rejected("Percentage must be between 0 and 100", {{"providedValue", value}}));
  }
  return mint<percentage>(value);
}

auto make_timestamp(double value) -> result<timestamp> {
  if (!is_whole(value)) {
    return failure<timestamp>(rejected("Timestamp must be an integer", {{"providedValue", value}}));
  }
  if (value <= 0) return failure<timestamp>(rejected("Timestamp must be positive", {{"providedValue", value}}));
  return mint<timestamp>(static_cast<std::int64_t>(value));
}

} // namespace contracts
