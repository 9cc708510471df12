#pragma once

#include <guildbank/schema/error_code.hpp>
#include <optional>
#include <string>
#include <utility>

namespace guildbank::schema {

/// Outcome of a core operation. Caller errors are reported through `code`
/// and `log`; `value` is engaged only when `code` is `error_code::ok`.
template <typename T>
struct operation_result final {
  error_code code{error_code::ok};
  std::string log;
  std::optional<T> value;

  bool ok() const { return code == error_code::ok; }
};

template <typename T>
operation_result<T> make_success(T value) {
  return operation_result<T>{
      .code = error_code::ok, .log = {}, .value = std::move(value)};
}

template <typename T>
operation_result<T> make_failure(const error_code code, std::string log) {
  return operation_result<T>{
      .code = code, .log = std::move(log), .value = std::nullopt};
}

}  // namespace guildbank::schema
