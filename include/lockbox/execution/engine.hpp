#pragma once

#include <lockbox/execution/expiry_scheduler.hpp>
#include <lockbox/execution/funds_transfer.hpp>
#include <lockbox/execution/journal.hpp>
#include <lockbox/execution/ledger.hpp>
#include <lockbox/execution/result.hpp>
#include <lockbox/execution/role_engine.hpp>
#include <lockbox/schema/app_info.hpp>
#include <lockbox/schema/deposit_record.hpp>
#include <lockbox/schema/encoding/encoder.hpp>
#include <lockbox/schema/event_record.hpp>
#include <lockbox/schema/primitives.hpp>
#include <lockbox/schema/probe_result.hpp>
#include <lockbox/schema/role_id.hpp>
#include <lockbox/schema/timed_role.hpp>
#include <lockbox/schema/transaction_error_code.hpp>
#include <lockbox/schema/transaction_result.hpp>
#include <lockbox/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace lockbox::execution {

inline constexpr std::string_view kAppVersion{"lockbox/1"};

/// Largest inclusive range `events()` returns in one call.
inline constexpr uint64_t kMaxEventRange = 1000;

/// Time-locked deposit vault with deposit-driven roles.
///
/// The engine is the single ownership and atomicity boundary for the ledger,
/// the role engine and the expiry scheduler. Every public call runs under one
/// mutex and either commits fully (events published, rows persisted, state
/// root advanced) or leaves no trace.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends and reload any state
  /// previously committed to `storage`.
  explicit engine(
      lockbox::schema::encoding::encoder<
          lockbox::schema::encoding::scale_encoder_tag>& encoder,
      lockbox::storage::storage<lockbox::storage::rocksdb_storage_tag>& storage,
      funds_transfer_t funds_transfer = accept_all_transfers());

  /// Lock `amount` for `lock_duration` seconds.
  ///
  /// `data` carries SCALE `tuple<uint64_t index, deposit_record_t>`.
  lockbox::schema::transaction_result_t deposit(
      const lockbox::schema::account_id_t& account,
      const lockbox::schema::amount_t& amount,
      lockbox::schema::duration_seconds_t lock_duration,
      lockbox::schema::timestamp_seconds_t now);

  /// Withdraw deposit slot `index`. `data` carries the SCALE paid amount.
  lockbox::schema::transaction_result_t withdraw(
      const lockbox::schema::account_id_t& account,
      uint64_t index,
      lockbox::schema::timestamp_seconds_t now);

  /// Report lapsed temporary roles without changing state.
  lockbox::schema::probe_result_t probe(
      lockbox::schema::timestamp_seconds_t now) const;

  /// Deactivate lapsed temporary roles among `candidates`.
  ///
  /// `data` carries the SCALE `uint32_t` count of accounts actually deactivated.
  lockbox::schema::transaction_result_t sweep(
      const std::vector<lockbox::schema::account_id_t>& candidates,
      lockbox::schema::timestamp_seconds_t now);

  lockbox::schema::amount_t total_locked() const;
  std::vector<lockbox::schema::deposit_record_t> deposits(
      const lockbox::schema::account_id_t& account) const;
  result_t<lockbox::schema::deposit_record_t> deposit_at(
      const lockbox::schema::account_id_t& account,
      uint64_t index) const;
  lockbox::schema::amount_t lifetime_deposited(
      const lockbox::schema::account_id_t& account) const;
  lockbox::schema::amount_t active_deposited(
      const lockbox::schema::account_id_t& account,
      lockbox::schema::timestamp_seconds_t now) const;
  std::vector<lockbox::schema::role_id_t> roles(
      const lockbox::schema::account_id_t& account) const;
  std::optional<lockbox::schema::timed_role_t> timed_role(
      const lockbox::schema::account_id_t& account) const;

  /// Latest committed sequence and state root.
  lockbox::schema::app_info_t info() const;

  /// Committed events with sequence in [from, to], capped at kMaxEventRange.
  std::vector<lockbox::schema::event_record_t> events(uint64_t from,
                                                      uint64_t to) const;

  /// Replace the currency rail used for withdrawals.
  void set_funds_transfer(funds_transfer_t funds_transfer);

  static funds_transfer_t accept_all_transfers();

 private:
  lockbox::schema::transaction_result_t reject(
      lockbox::schema::transaction_error_code code,
      std::string_view codespace) const;

  /// Commit `tx`, advance the state root and persist every touched row.
  lockbox::schema::transaction_result_t finish(
      journal& tx,
      std::string_view codespace,
      lockbox::schema::bytes_t data,
      const std::vector<lockbox::schema::account_id_t>& touched,
      lockbox::schema::timestamp_seconds_t now);

  /// Load committed rows from storage and verify conservation.
  void load_persisted_state();

  mutable std::mutex mutex_;
  lockbox::schema::encoding::encoder<
      lockbox::schema::encoding::scale_encoder_tag>& encoder_;
  lockbox::storage::storage<lockbox::storage::rocksdb_storage_tag>& storage_;
  ledger ledger_;
  role_engine roles_;
  expiry_scheduler scheduler_;
  funds_transfer_t funds_transfer_;
  uint64_t last_sequence_{};
  lockbox::schema::hash32_t state_root_{};
  uint64_t next_event_sequence_{};
  std::size_t persisted_registry_size_{};
};

}  // namespace lockbox::execution
