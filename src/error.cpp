#include "contracts/error.hpp"

#include <array>
#include <sstream>
#include <utility>

namespace contracts::core {

namespace {

auto normalize_context(context_map context) -> context_map {
  if (context.is_null()) return context_map::object();
  if (context.is_object()) return context;
  context_map boxed = context_map::object();
  boxed["value"] = std::move(context);
  return boxed;
}

constexpr std::array<error_kind, 9> kAllKinds{
    error_kind::validation,          error_kind::unauthorized,
    error_kind::forbidden,           error_kind::rate_limit_exceeded,
    error_kind::not_found,           error_kind::conflict,
    error_kind::external_service_error, error_kind::cancelled,
    error_kind::internal,
};

} // namespace

app_error::app_error(error_kind code, std::string message, context_map context)
    : code_(code), message_(std::move(message)), context_(normalize_context(std::move(context))) {}

app_error::~app_error() {
  auto next = std::move(cause_);
  while (next && next.use_count() == 1) {
    next = std::move(next->cause_);
  }
}

auto app_error::external_cause() const noexcept -> const external_error* {
  return root_cause().external_.get();
}

auto app_error::cause_chain() const -> std::vector<std::string> {
  std::vector<std::string> chain;
  const app_error* node = this;
  while (node->cause_) {
    node = node->cause_.get();
    chain.push_back(node->message_);
  }
  if (node->external_ && node->external_->message != node->message_) chain.push_back(node->external_->message);
  return chain;
}

auto app_error::root_cause() const noexcept -> const app_error& {
  const app_error* node = this;
  while (node->cause_) node = node->cause_.get();
  return *node;
}

auto operator==(const app_error& a, const app_error& b) -> bool {
  const app_error* x = &a;
  const app_error* y = &b;
  while (x != y) {
    if (x->code_ != y->code_ || x->message_ != y->message_ || x->context_ != y->context_) return false;
    if (static_cast<bool>(x->external_) != static_cast<bool>(y->external_)) return false;
    if (x->external_ && *x->external_ != *y->external_) return false;
    if (static_cast<bool>(x->cause_) != static_cast<bool>(y->cause_)) return false;
    if (!x->cause_) return true;
    x = x->cause_.get();
    y = y->cause_.get();
  }
  return true;
}

auto make_error(error_kind code, std::string message, context_map context) -> app_error {
  return app_error(code, std::move(message), std::move(context));
}

auto wrap(error_kind code, std::string message, app_error cause, context_map context) -> app_error {
  app_error e(code, std::move(message), std::move(context));
  e.cause_ = std::make_shared<app_error>(std::move(cause));
  return e;
}

auto from_external(error_kind code, std::string message, external_error origin,
                   context_map context) -> app_error {
  app_error e(code, std::move(message), std::move(context));
  e.external_ = std::make_shared<const external_error>(std::move(origin));
  return e;
}

auto parse_error_kind(std::string_view name) noexcept -> std::optional<error_kind> {
  for (auto kind : kAllKinds) {
    if (to_string(kind) == name) return kind;
  }
  return std::nullopt;
}

auto humanize(const app_error& e) -> std::string {
  switch (e.code()) {
    case error_kind::validation: return "Please check your input and try again.";
    case error_kind::not_found: return "The requested resource was not found.";
    case error_kind::unauthorized: return "Please log in to continue.";
    case error_kind::forbidden: return "You don't have permission to access this resource.";
    case error_kind::conflict: return "A conflict occurred. Please refresh and try again.";
    case error_kind::internal: return "An unexpected error occurred. Please try again.";
    case error_kind::external_service_error:
      return "External service is unavailable. Please try again later.";
    case error_kind::rate_limit_exceeded:
      return "Too many requests. Please wait a moment and try again.";
    case error_kind::cancelled: return "The operation was cancelled.";
  }
  return "An error occurred. Please try again.";
}

auto format_for_developers(const app_error& e) -> std::string {
  std::ostringstream os;
  os << '[' << to_string(e.code()) << "] " << e.message();
  if (!e.context().empty()) {
    os << "\nDetails: " << e.context().dump(2, ' ', false, context_map::error_handler_t::replace);
  }
  if (e.cause() != nullptr) {
    os << "\nCause: " << e.cause()->message();
  } else if (e.external_cause() != nullptr) {
    os << "\nCause: " << e.external_cause()->message;
  }
  return os.str();
}

} // namespace contracts::core
