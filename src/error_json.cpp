#include "contracts/error_json.hpp"

#include <algorithm>
#include <cctype>

namespace contracts::core {

auto to_json(const app_error& e) -> nlohmann::ordered_json {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  j["code"] = std::string(to_string(e.code()));
  j["message"] = e.message();
  j["context"] = e.context();
  j["causeChain"] = e.cause_chain();
  return j;
}

auto to_json_string(const app_error& e, int indent) -> std::string {
  return to_json(e).dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

auto try_make_error(std::string_view code_name, std::string_view message,
                    const nlohmann::ordered_json& context) -> result<app_error, std::string> {
  using out = result<app_error, std::string>;
  auto kind = parse_error_kind(code_name);
  if (!kind) return out::failure("Invalid error code: " + std::string(code_name));
  if (message.empty()) return out::failure("Error message must be a non-empty string");
  const bool blank = std::all_of(message.begin(), message.end(),
                                 [](unsigned char c) { return std::isspace(c) != 0; });
  if (blank) return out::failure("Error message cannot be empty or whitespace only");
  if (!context.is_null() && !context.is_object()) {
    return out::failure("Error details must be a plain object");
  }
  return out::success(make_error(*kind, std::string(message), context));
}

} // namespace contracts::core
