#include "contracts/throwable.hpp"

#include <expected>
#include <future>
#include <string>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#include <cstdlib>
#include <memory>
#endif

namespace {

auto type_name(const std::type_info& info) -> std::string {
#if defined(__GNUG__)
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(
      abi::__cxa_demangle(info.name(), nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled) return std::string(demangled.get());
#endif
  return std::string(info.name());
}

} // namespace

namespace contracts::core {

app_exception::app_exception(app_error error)
    : std::runtime_error(error.message()), error_(std::move(error)) {}

auto to_app_error(std::exception_ptr ep) -> app_error {
  if (!ep) return make_error(error_kind::internal, "Unknown error occurred");
  try {
    std::rethrow_exception(ep);
  } catch (const app_exception& e) {
    return e.error();
  } catch (const std::bad_expected_access<app_error>& e) {
    return e.error();
  } catch (const std::future_error& e) {
    if (e.code() == std::future_errc::broken_promise) {
      return from_external(error_kind::cancelled, "Asynchronous operation was abandoned",
                           external_error{"std::future_error", e.what()});
    }
    return from_external(error_kind::internal, e.what(), external_error{"std::future_error", e.what()});
  } catch (const std::exception& e) {
    return from_external(error_kind::internal, e.what(), external_error{type_name(typeid(e)), e.what()});
  } catch (const std::string& s) {
    return make_error(error_kind::internal, "Unknown error occurred", {{"originalError", s}});
  } catch (const char* s) {
    return make_error(error_kind::internal, "Unknown error occurred",
                      {{"originalError", s != nullptr ? std::string(s) : std::string()}});
  } catch (...) {
    return make_error(error_kind::internal, "Unknown error occurred");
  }
}

} // namespace contracts::core

namespace contracts {

auto error_traits<std::string>::from_exception(std::exception_ptr ep) -> std::string {
  if (!ep) return "Unknown error occurred";
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    return e.what();
  } catch (const std::string& s) {
    return s;
  } catch (const char* s) {
    return s != nullptr ? std::string(s) : std::string("Unknown error occurred");
  } catch (...) {
    return "Unknown error occurred";
  }
}

} // namespace contracts
