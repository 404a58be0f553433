#pragma once

#include <lockbox/execution/funds_transfer.hpp>
#include <lockbox/execution/journal.hpp>
#include <lockbox/execution/result.hpp>
#include <lockbox/schema/deposit_record.hpp>
#include <lockbox/schema/lock_period.hpp>
#include <lockbox/schema/primitives.hpp>
#include <cstdint>
#include <map>
#include <vector>

namespace lockbox::execution {

/// What `ledger::deposit` hands back to the caller.
struct deposit_receipt final {
  uint64_t index{};
  lockbox::schema::lock_period_t period{};
  lockbox::schema::deposit_record_t record;
};

/// Per-account deposit slots and the global locked total.
///
/// Invariant: `total_locked()` equals the sum of `amount` over every slot
/// that has not been withdrawn. Every mutation is recorded in the caller's
/// journal so an aborted call leaves the ledger untouched.
class ledger final {
 public:
  /// Append a locked slot for `account`.
  ///
  /// Fails with `zero_amount`, `invalid_lock_period`, or `amount_overflow`
  /// when the locked or lifetime total would exceed 256 bits;
  /// `lock_duration` must equal one of the canonical periods to the second.
  result_t<deposit_receipt> deposit(journal& tx,
                                    const lockbox::schema::account_id_t& account,
                                    const lockbox::schema::amount_t& amount,
                                    lockbox::schema::duration_seconds_t lock_duration,
                                    lockbox::schema::timestamp_seconds_t now);

  /// Withdraw slot `index` and pay it out through `transfer`.
  ///
  /// Fails with `invalid_index`, `lock_not_expired`, `already_withdrawn`, or
  /// `transfer_failed`. On `transfer_failed` the slot and total have been
  /// zeroed inside `tx` and are restored when the journal rolls back.
  result_t<lockbox::schema::amount_t> withdraw(
      journal& tx,
      const lockbox::schema::account_id_t& account,
      uint64_t index,
      lockbox::schema::timestamp_seconds_t now,
      const funds_transfer_t& transfer);

  const lockbox::schema::amount_t& total_locked() const;
  std::vector<lockbox::schema::deposit_record_t> deposits(
      const lockbox::schema::account_id_t& account) const;
  result_t<lockbox::schema::deposit_record_t> deposit_at(
      const lockbox::schema::account_id_t& account,
      uint64_t index) const;
  /// Sum of every amount ever deposited, withdrawn slots included.
  lockbox::schema::amount_t lifetime_deposited(
      const lockbox::schema::account_id_t& account) const;
  /// Sum of slots that are not withdrawn and still locked at `now`.
  lockbox::schema::amount_t active_deposited(
      const lockbox::schema::account_id_t& account,
      lockbox::schema::timestamp_seconds_t now) const;
  uint64_t deposit_count(const lockbox::schema::account_id_t& account) const;

  /// Sum of `amount` over all non-withdrawn slots, recomputed from scratch.
  lockbox::schema::amount_t sum_unwithdrawn() const;

  void restore_deposits(const lockbox::schema::account_id_t& account,
                        std::vector<lockbox::schema::deposit_record_t> records);
  void restore_lifetime(const lockbox::schema::account_id_t& account,
                        const lockbox::schema::amount_t& amount);
  void restore_total_locked(const lockbox::schema::amount_t& amount);

 private:
  /// Advance the cached status and zero the slot. Returns the released amount.
  result_t<lockbox::schema::amount_t> transition(
      journal& tx,
      const lockbox::schema::account_id_t& account,
      uint64_t index,
      lockbox::schema::timestamp_seconds_t now);

  bool release_funds(const lockbox::schema::account_id_t& account,
                     const lockbox::schema::amount_t& amount,
                     const funds_transfer_t& transfer) const;

  std::map<lockbox::schema::account_id_t,
           std::vector<lockbox::schema::deposit_record_t>>
      deposits_;
  std::map<lockbox::schema::account_id_t, lockbox::schema::amount_t>
      lifetime_deposited_;
  lockbox::schema::amount_t total_locked_{};
};

}  // namespace lockbox::execution
