#include <spdlog/spdlog.h>
#include <lockbox/execution/expiry_scheduler.hpp>
#include <lockbox/schema/timed_role.hpp>
#include <lockbox/schema/transaction_event.hpp>
#include <algorithm>
#include <string>

using namespace lockbox::schema;

namespace lockbox::execution {

expiry_scheduler::expiry_scheduler(role_engine& roles,
                                   const std::size_t batch_limit)
    : roles_{roles}, batch_limit_{batch_limit} {}

probe_result_t expiry_scheduler::probe(const timestamp_seconds_t now) const {
  auto result = probe_result_t{};
  for (const auto& account : roles_.registry()) {
    if (result.candidates.size() >= batch_limit_) {
      break;
    }
    if (is_lapsed(account, now)) {
      result.candidates.push_back(account);
    }
  }
  result.work_needed = !result.candidates.empty();
  spdlog::debug("Probe at {} found {} lapsed temporary role(s)", now,
                result.candidates.size());
  return result;
}

std::vector<account_id_t> expiry_scheduler::sweep(
    journal& tx,
    const std::vector<account_id_t>& candidates,
    const timestamp_seconds_t now) {
  auto count = std::min(candidates.size(), batch_limit_);
  if (count < candidates.size()) {
    spdlog::warn("Sweep received {} candidates; processing the first {}",
                 candidates.size(), count);
  }

  auto revoked = std::vector<account_id_t>{};
  for (std::size_t i = 0; i < count; ++i) {
    const auto& account = candidates[i];
    // A candidate refreshed since the probe is no longer lapsed.
    if (!is_lapsed(account, now) || !roles_.revoke_temporary_role(tx, account)) {
      continue;
    }
    tx.emit(transaction_event_t{
        .type = std::string{kTemporaryRoleRevokedEventType},
        .attributes = {
            make_event_attribute("account", to_string(account), true),
            make_event_attribute("timestamp", std::to_string(now))}});
    revoked.push_back(account);
  }
  return revoked;
}

std::size_t expiry_scheduler::batch_limit() const {
  return batch_limit_;
}

bool expiry_scheduler::is_lapsed(const account_id_t& account,
                                 const timestamp_seconds_t now) const {
  auto role = roles_.timed_role(account);
  return role.has_value() && role->active &&
         now > role->last_active + kTemporaryRoleWindow;
}

}  // namespace lockbox::execution
