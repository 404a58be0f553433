#include <spdlog/spdlog.h>
#include <lockbox/blake3/hash.hpp>
#include <lockbox/common/critical.hpp>
#include <lockbox/execution/engine.hpp>
#include <lockbox/schema/key/engine_keys.hpp>
#include <algorithm>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace lockbox::schema;

namespace lockbox::execution {

namespace {

using encoder_t = lockbox::schema::encoding::encoder<
    lockbox::schema::encoding::scale_encoder_tag>;

inline constexpr std::string_view kGenesisSeed{"lockbox-genesis-v1"};
inline constexpr std::string_view kDepositCodespace{"lockbox.deposit"};
inline constexpr std::string_view kWithdrawCodespace{"lockbox.withdraw"};
inline constexpr std::string_view kSweepCodespace{"lockbox.sweep"};

hash32_t fold_state_root(const hash32_t& seed,
                         uint64_t sequence,
                         std::string_view operation,
                         const bytes_t& payload) {
  auto material = bytes_t{};
  material.reserve(seed.size() + payload.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));

  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{sequence, std::string{operation}});
  material.insert(std::end(material), std::begin(encoded), std::end(encoded));
  material.insert(std::end(material), std::begin(payload), std::end(payload));
  return lockbox::blake3::hash(bytes_view_t{material.data(), material.size()});
}

bytes_view_t view_of(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

engine::engine(encoder_t& encoder,
               lockbox::storage::storage<lockbox::storage::rocksdb_storage_tag>&
                   storage,
               funds_transfer_t funds_transfer)
    : encoder_{encoder},
      storage_{storage},
      scheduler_{roles_},
      funds_transfer_{std::move(funds_transfer)} {
  auto lock = std::scoped_lock{mutex_};
  state_root_ = lockbox::blake3::hash(kGenesisSeed);
  load_persisted_state();
  spdlog::info("Lockbox engine ready at sequence {} with {} locked",
               last_sequence_, to_string(ledger_.total_locked()));
}

funds_transfer_t engine::accept_all_transfers() {
  return [](const account_id_t&, const amount_t&) { return true; };
}

void engine::set_funds_transfer(funds_transfer_t funds_transfer) {
  auto lock = std::scoped_lock{mutex_};
  funds_transfer_ = std::move(funds_transfer);
}

transaction_result_t engine::deposit(const account_id_t& account,
                                     const amount_t& amount,
                                     const duration_seconds_t lock_duration,
                                     const timestamp_seconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = journal{};

  auto receipt = ledger_.deposit(tx, account, amount, lock_duration, now);
  if (!succeeded(receipt)) {
    return reject(error_of(receipt), kDepositCodespace);
  }
  const auto& value = std::get<deposit_receipt>(receipt);

  roles_.evaluate(tx, account,
                  deposit_facts{.amount = amount,
                                .period = value.period,
                                .deposit_count = ledger_.deposit_count(account)},
                  now);
  roles_.refresh_activity(tx, account, now);

  auto data = encoder_.encode(std::tuple{value.index, value.record});
  spdlog::info("Deposit #{} of {} by {} ({})", value.index, to_string(amount),
               to_string(account), to_string(value.period));
  return finish(tx, kDepositCodespace, std::move(data), {account}, now);
}

transaction_result_t engine::withdraw(const account_id_t& account,
                                      const uint64_t index,
                                      const timestamp_seconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = journal{};

  auto released = ledger_.withdraw(tx, account, index, now, funds_transfer_);
  if (!succeeded(released)) {
    return reject(error_of(released), kWithdrawCodespace);
  }
  const auto& amount = std::get<amount_t>(released);
  roles_.refresh_activity(tx, account, now);

  auto data = encoder_.encode(amount);
  spdlog::info("Withdrawal #{} of {} by {}", index, to_string(amount),
               to_string(account));
  return finish(tx, kWithdrawCodespace, std::move(data), {account}, now);
}

probe_result_t engine::probe(const timestamp_seconds_t now) const {
  auto lock = std::scoped_lock{mutex_};
  return scheduler_.probe(now);
}

transaction_result_t engine::sweep(const std::vector<account_id_t>& candidates,
                                   const timestamp_seconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto tx = journal{};

  auto revoked = scheduler_.sweep(tx, candidates, now);
  auto data = encoder_.encode(static_cast<uint32_t>(revoked.size()));
  if (revoked.empty()) {
    tx.commit();
    spdlog::debug("Sweep of {} candidate(s) deactivated nothing",
                  candidates.size());
    return transaction_result_t{.data = std::move(data),
                                .codespace = std::string{kSweepCodespace}};
  }
  spdlog::info("Sweep deactivated {} of {} candidate(s)", revoked.size(),
               candidates.size());
  return finish(tx, kSweepCodespace, std::move(data), revoked, now);
}

amount_t engine::total_locked() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.total_locked();
}

std::vector<deposit_record_t> engine::deposits(
    const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.deposits(account);
}

result_t<deposit_record_t> engine::deposit_at(const account_id_t& account,
                                              const uint64_t index) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.deposit_at(account, index);
}

amount_t engine::lifetime_deposited(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.lifetime_deposited(account);
}

amount_t engine::active_deposited(const account_id_t& account,
                                  const timestamp_seconds_t now) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.active_deposited(account, now);
}

std::vector<role_id_t> engine::roles(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return roles_.roles(account);
}

std::optional<timed_role_t> engine::timed_role(
    const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return roles_.timed_role(account);
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  return app_info_t{.app_version = std::string{kAppVersion},
                    .last_sequence = last_sequence_,
                    .state_root = state_root_};
}

std::vector<event_record_t> engine::events(const uint64_t from,
                                           const uint64_t to) const {
  auto lock = std::scoped_lock{mutex_};
  auto records = std::vector<event_record_t>{};
  if (from > to || from >= next_event_sequence_) {
    return records;
  }
  auto last = std::min(to, next_event_sequence_ - 1);
  if (last - from >= kMaxEventRange) {
    last = from + kMaxEventRange - 1;
  }

  auto encoder = encoder_t{};
  for (auto sequence = from; sequence <= last; ++sequence) {
    auto key = lockbox::schema::key::make_event_key(encoder, sequence);
    auto record = storage_.get<event_record_t>(encoder, view_of(key));
    if (!record) {
      lockbox::common::critical("committed event {} missing from storage",
                                sequence);
    }
    records.push_back(std::move(record.value()));
  }
  return records;
}

transaction_result_t engine::reject(const transaction_error_code code,
                                    const std::string_view codespace) const {
  spdlog::warn("Rejected {} call: {}", codespace, to_string(code));
  return transaction_result_t{.code = static_cast<uint32_t>(code),
                              .log = std::string{to_string(code)},
                              .codespace = std::string{codespace}};
}

transaction_result_t engine::finish(journal& tx,
                                    const std::string_view codespace,
                                    bytes_t data,
                                    const std::vector<account_id_t>& touched,
                                    const timestamp_seconds_t now) {
  auto events = tx.commit();
  auto sequence = last_sequence_ + 1;
  auto root = fold_state_root(state_root_, sequence, codespace, data);

  namespace key = lockbox::schema::key;
  auto rows = std::vector<lockbox::storage::key_value_entry_t>{};
  for (const auto& account : touched) {
    rows.emplace_back(key::make_deposits_key(encoder_, account),
                      encoder_.encode(ledger_.deposits(account)));
    rows.emplace_back(key::make_lifetime_key(encoder_, account),
                      encoder_.encode(ledger_.lifetime_deposited(account)));
    rows.emplace_back(key::make_roles_key(encoder_, account),
                      encoder_.encode(roles_.roles(account)));
    if (auto timed = roles_.timed_role(account)) {
      rows.emplace_back(key::make_timed_role_key(encoder_, account),
                        encoder_.encode(timed.value()));
    }
  }
  rows.emplace_back(key::make_total_locked_key(encoder_),
                    encoder_.encode(ledger_.total_locked()));

  const auto& registry = roles_.registry();
  for (auto position = persisted_registry_size_; position < registry.size();
       ++position) {
    rows.emplace_back(
        key::make_registry_key(encoder_, static_cast<uint64_t>(position)),
        encoder_.encode(
            std::tuple{static_cast<uint64_t>(position), registry[position]}));
  }

  auto next_event = next_event_sequence_;
  for (const auto& event : events) {
    rows.emplace_back(key::make_event_key(encoder_, next_event),
                      encoder_.encode(event_record_t{.sequence = next_event,
                                                     .operation = sequence,
                                                     .timestamp = now,
                                                     .event = event}));
    ++next_event;
  }
  rows.emplace_back(key::make_event_sequence_key(encoder_),
                    encoder_.encode(next_event));

  storage_.commit(rows, lockbox::storage::committed_state{
                            .sequence = sequence, .state_root = root});

  last_sequence_ = sequence;
  state_root_ = root;
  next_event_sequence_ = next_event;
  persisted_registry_size_ = registry.size();

  return transaction_result_t{.data = std::move(data),
                              .info = to_hex(bytes_view_t{root.data(),
                                                          root.size()}),
                              .codespace = std::string{codespace},
                              .events = std::move(events)};
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_sequence_ = committed->sequence;
    state_root_ = committed->state_root;
  }

  namespace key = lockbox::schema::key;
  auto load_rows = [&](std::string_view prefix, auto&& apply) {
    auto prefix_key = key::make_prefix_key(encoder_, prefix);
    for (const auto& [row_key, row_value] :
         storage_.list_by_prefix(view_of(prefix_key))) {
      auto account = key::parse_account_key(encoder_, prefix, view_of(row_key));
      if (!account) {
        lockbox::common::critical("malformed state key under '{}'", prefix);
      }
      apply(account.value(), view_of(row_value));
    }
  };

  load_rows(key::kDepositsKeyPrefix, [&](const account_id_t& account,
                                         const bytes_view_t& value) {
    ledger_.restore_deposits(
        account, encoder_.decode<std::vector<deposit_record_t>>(value));
  });
  load_rows(key::kLifetimeKeyPrefix, [&](const account_id_t& account,
                                         const bytes_view_t& value) {
    ledger_.restore_lifetime(account, encoder_.decode<amount_t>(value));
  });
  load_rows(key::kRolesKeyPrefix, [&](const account_id_t& account,
                                      const bytes_view_t& value) {
    roles_.restore_roles(account, encoder_.decode<std::vector<role_id_t>>(value));
  });
  load_rows(key::kTimedRoleKeyPrefix, [&](const account_id_t& account,
                                          const bytes_view_t& value) {
    roles_.restore_timed_role(account, encoder_.decode<timed_role_t>(value));
  });

  auto registry_prefix = key::make_prefix_key(encoder_, key::kRegistryKeyPrefix);
  auto positioned = std::vector<std::tuple<uint64_t, account_id_t>>{};
  for (const auto& [row_key, row_value] :
       storage_.list_by_prefix(view_of(registry_prefix))) {
    positioned.push_back(
        encoder_.decode<std::tuple<uint64_t, account_id_t>>(view_of(row_value)));
  }
  std::sort(std::begin(positioned), std::end(positioned));
  auto registry = std::vector<account_id_t>{};
  registry.reserve(positioned.size());
  for (const auto& [position, account] : positioned) {
    if (position != registry.size()) {
      lockbox::common::critical("temporary role registry has a gap at {}",
                                registry.size());
    }
    registry.push_back(account);
  }
  persisted_registry_size_ = registry.size();
  roles_.restore_registry(std::move(registry));

  auto total_key = key::make_total_locked_key(encoder_);
  if (auto total = storage_.get<amount_t>(encoder_, view_of(total_key))) {
    ledger_.restore_total_locked(total.value());
  }
  if (ledger_.total_locked() != ledger_.sum_unwithdrawn()) {
    spdlog::error("Persisted total {} does not match deposits {}",
                  to_string(ledger_.total_locked()),
                  to_string(ledger_.sum_unwithdrawn()));
    lockbox::common::critical("locked total conservation violated on load");
  }

  auto sequence_key = key::make_event_sequence_key(encoder_);
  next_event_sequence_ =
      storage_.get<uint64_t>(encoder_, view_of(sequence_key)).value_or(0);
}

}  // namespace lockbox::execution
