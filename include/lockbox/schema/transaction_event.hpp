#pragma once

#include <lockbox/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Schema type: transaction event.
// Emitted by deposits, withdrawals, role grants and sweeps. Events of a call
// are only published when the call commits.
namespace lockbox::schema {

inline constexpr std::string_view kDepositEventType{"lockbox.deposit"};
inline constexpr std::string_view kWithdrawEventType{"lockbox.withdraw"};
inline constexpr std::string_view kRoleGrantedEventType{"lockbox.role_granted"};
inline constexpr std::string_view kTemporaryRoleGrantedEventType{
    "lockbox.temporary_role_granted"};
inline constexpr std::string_view kTemporaryRoleRevokedEventType{
    "lockbox.temporary_role_revoked"};

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

inline transaction_event_attribute_t make_event_attribute(std::string key,
                                                          std::string value,
                                                          bool index = false) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

}  // namespace lockbox::schema
