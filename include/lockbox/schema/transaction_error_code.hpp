#pragma once

#include <lockbox/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace lockbox::schema {

enum class transaction_error_code : uint32_t {
  invalid_request = 1,
  zero_amount = 10,
  invalid_lock_period = 11,
  invalid_index = 12,
  lock_not_expired = 13,
  already_withdrawn = 14,
  transfer_failed = 15,
  amount_overflow = 16,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "invalid request", transaction_error_code::invalid_request},
    std::pair<std::string_view, transaction_error_code>{
        "amount must be greater than zero",
        transaction_error_code::zero_amount},
    std::pair<std::string_view, transaction_error_code>{
        "lock period must be 180, 365 or 1825 days",
        transaction_error_code::invalid_lock_period},
    std::pair<std::string_view, transaction_error_code>{
        "deposit index out of range", transaction_error_code::invalid_index},
    std::pair<std::string_view, transaction_error_code>{
        "deposit is still locked", transaction_error_code::lock_not_expired},
    std::pair<std::string_view, transaction_error_code>{
        "deposit already withdrawn",
        transaction_error_code::already_withdrawn},
    std::pair<std::string_view, transaction_error_code>{
        "currency transfer failed", transaction_error_code::transfer_failed},
    std::pair<std::string_view, transaction_error_code>{
        "deposit would overflow the locked or lifetime total",
        transaction_error_code::amount_overflow},
};

inline constexpr std::string_view to_string(const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

}  // namespace lockbox::schema
