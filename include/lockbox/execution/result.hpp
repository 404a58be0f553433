#pragma once

#include <lockbox/schema/transaction_error_code.hpp>
#include <variant>

namespace lockbox::execution {

/// Either the value produced by a core operation or the reason it was
/// rejected. Rejected operations leave no trace in state.
template <typename T>
using result_t = std::variant<T, lockbox::schema::transaction_error_code>;

template <typename T>
bool succeeded(const result_t<T>& result) {
  return std::holds_alternative<T>(result);
}

template <typename T>
lockbox::schema::transaction_error_code error_of(const result_t<T>& result) {
  return std::get<lockbox::schema::transaction_error_code>(result);
}

}  // namespace lockbox::execution
