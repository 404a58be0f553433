#include <spdlog/spdlog.h>
#include <lockbox/common/critical.hpp>
#include <lockbox/execution/ledger.hpp>
#include <limits>
#include <utility>

using namespace lockbox::schema;

namespace lockbox::execution {

result_t<deposit_receipt> ledger::deposit(journal& tx,
                                          const account_id_t& account,
                                          const amount_t& amount,
                                          const duration_seconds_t lock_duration,
                                          const timestamp_seconds_t now) {
  if (amount == 0) {
    return transaction_error_code::zero_amount;
  }
  auto period = try_lock_period(lock_duration);
  if (!period) {
    return transaction_error_code::invalid_lock_period;
  }
  const auto kMaxAmount = std::numeric_limits<amount_t>::max();
  if (amount > kMaxAmount - total_locked_ ||
      amount > kMaxAmount - lifetime_deposited(account)) {
    return transaction_error_code::amount_overflow;
  }

  auto record = deposit_record_t{.amount = amount,
                                 .created_at = now,
                                 .lock_until = now + lock_duration,
                                 .status = deposit_status_t::locked,
                                 .withdrawn = false};

  auto [slots, inserted] = deposits_.try_emplace(account);
  slots->second.push_back(record);
  auto index = static_cast<uint64_t>(slots->second.size() - 1);
  total_locked_ += amount;
  lifetime_deposited_[account] += amount;
  tx.on_rollback([this, account, amount, inserted = inserted] {
    auto& records = deposits_[account];
    records.pop_back();
    if (inserted) {
      deposits_.erase(account);
    }
    total_locked_ -= amount;
    auto lifetime = lifetime_deposited_.find(account);
    lifetime->second -= amount;
    if (lifetime->second == 0) {
      lifetime_deposited_.erase(lifetime);
    }
  });

  tx.emit(transaction_event_t{
      .type = std::string{kDepositEventType},
      .attributes = {make_event_attribute("account", to_string(account), true),
                     make_event_attribute("amount", to_string(amount)),
                     make_event_attribute("lock_until",
                                          std::to_string(record.lock_until)),
                     make_event_attribute("index", std::to_string(index))}});

  spdlog::debug("Recorded deposit #{} of {} for {} locked until {}", index,
                to_string(amount), to_string(account), record.lock_until);
  return deposit_receipt{.index = index, .period = *period, .record = record};
}

result_t<amount_t> ledger::withdraw(journal& tx,
                                    const account_id_t& account,
                                    const uint64_t index,
                                    const timestamp_seconds_t now,
                                    const funds_transfer_t& transfer) {
  auto released = transition(tx, account, index, now);
  if (!succeeded(released)) {
    return released;
  }
  auto amount = std::get<amount_t>(released);

  tx.emit(transaction_event_t{
      .type = std::string{kWithdrawEventType},
      .attributes = {make_event_attribute("account", to_string(account), true),
                     make_event_attribute("amount", to_string(amount)),
                     make_event_attribute("timestamp", std::to_string(now)),
                     make_event_attribute("index", std::to_string(index))}});

  if (!release_funds(account, amount, transfer)) {
    spdlog::warn("Transfer of {} to {} failed; withdrawal #{} rolled back",
                 to_string(amount), to_string(account), index);
    return transaction_error_code::transfer_failed;
  }
  return amount;
}

result_t<amount_t> ledger::transition(journal& tx,
                                      const account_id_t& account,
                                      const uint64_t index,
                                      const timestamp_seconds_t now) {
  auto found = deposits_.find(account);
  if (found == std::end(deposits_) || index >= found->second.size()) {
    return transaction_error_code::invalid_index;
  }

  auto& record = found->second[index];
  tx.on_rollback([this, account, index, previous = record] {
    deposits_[account][index] = previous;
  });

  if (record.status == deposit_status_t::locked && now >= record.lock_until) {
    record.status = deposit_status_t::unlocked;
  }
  if (record.status == deposit_status_t::locked) {
    return transaction_error_code::lock_not_expired;
  }
  if (record.withdrawn) {
    return transaction_error_code::already_withdrawn;
  }

  auto amount = record.amount;
  if (total_locked_ < amount) {
    lockbox::common::critical("total locked is smaller than a live deposit");
  }
  record = make_withdrawn_record();
  total_locked_ -= amount;
  tx.on_rollback([this, amount] { total_locked_ += amount; });
  return amount;
}

bool ledger::release_funds(const account_id_t& account,
                           const amount_t& amount,
                           const funds_transfer_t& transfer) const {
  if (!transfer) {
    spdlog::error("No funds transfer installed; cannot pay {}",
                  to_string(account));
    return false;
  }
  return transfer(account, amount);
}

const amount_t& ledger::total_locked() const {
  return total_locked_;
}

std::vector<deposit_record_t> ledger::deposits(
    const account_id_t& account) const {
  auto found = deposits_.find(account);
  if (found == std::end(deposits_)) {
    return {};
  }
  return found->second;
}

result_t<deposit_record_t> ledger::deposit_at(const account_id_t& account,
                                              const uint64_t index) const {
  auto found = deposits_.find(account);
  if (found == std::end(deposits_) || index >= found->second.size()) {
    return transaction_error_code::invalid_index;
  }
  return found->second[index];
}

amount_t ledger::lifetime_deposited(const account_id_t& account) const {
  auto found = lifetime_deposited_.find(account);
  return found == std::end(lifetime_deposited_) ? amount_t{} : found->second;
}

amount_t ledger::active_deposited(const account_id_t& account,
                                  const timestamp_seconds_t now) const {
  auto total = amount_t{};
  auto found = deposits_.find(account);
  if (found == std::end(deposits_)) {
    return total;
  }
  for (const auto& record : found->second) {
    if (!record.withdrawn && now < record.lock_until) {
      total += record.amount;
    }
  }
  return total;
}

uint64_t ledger::deposit_count(const account_id_t& account) const {
  auto found = deposits_.find(account);
  return found == std::end(deposits_) ? 0 : found->second.size();
}

amount_t ledger::sum_unwithdrawn() const {
  auto total = amount_t{};
  for (const auto& [account, records] : deposits_) {
    for (const auto& record : records) {
      if (!record.withdrawn) {
        total += record.amount;
      }
    }
  }
  return total;
}

void ledger::restore_deposits(const account_id_t& account,
                              std::vector<deposit_record_t> records) {
  deposits_[account] = std::move(records);
}

void ledger::restore_lifetime(const account_id_t& account,
                              const amount_t& amount) {
  lifetime_deposited_[account] = amount;
}

void ledger::restore_total_locked(const amount_t& amount) {
  total_locked_ = amount;
}

}  // namespace lockbox::execution
