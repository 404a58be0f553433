#pragma once
#include <lockbox/schema/deposit_status.hpp>
#include <lockbox/schema/primitives.hpp>
#include <cstdint>

// Schema type: deposit record.
// Staking workflow: one locked deposit slot. Slots are append-only; a
// withdrawal zeroes the slot and marks it terminal so indices stay stable.
namespace lockbox::schema {

template <uint16_t Version>
struct deposit_record;

template <>
struct deposit_record<1> final {
  uint16_t version{1};
  amount_t amount{};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t lock_until{};
  deposit_status_t status{deposit_status_t::locked};
  bool withdrawn{};

  bool operator==(const deposit_record<1>&) const = default;
};

using deposit_record_t = deposit_record<1>;

/// Terminal form of a slot after a successful withdrawal.
inline deposit_record_t make_withdrawn_record() {
  return deposit_record_t{.amount = 0,
                          .created_at = 0,
                          .lock_until = 0,
                          .status = deposit_status_t::unlocked,
                          .withdrawn = true};
}

}  // namespace lockbox::schema
