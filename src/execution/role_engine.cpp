#include <spdlog/spdlog.h>
#include <array>
#include <lockbox/execution/role_engine.hpp>
#include <string_view>
#include <utility>

using namespace lockbox::schema;

namespace lockbox::execution {

namespace {

constexpr auto kFrequentDepositCount = uint64_t{3};

struct grant_rule final {
  std::string_view name;
  bool (*matches)(const deposit_facts&);
  role_id_t role;
};

// Mutually exclusive by order, not additive: a deposit earns at most one role.
const auto kGrantRules = std::array{
    grant_rule{"long_term_commitment",
               [](const deposit_facts& facts) {
                 return facts.amount >= kUnit &&
                        facts.period == lock_period_t::long_term;
               },
               role_id_t::long_term_committer},
    grant_rule{"frequent_deposits",
               [](const deposit_facts& facts) {
                 return facts.amount >= kUnit &&
                        facts.deposit_count >= kFrequentDepositCount;
               },
               role_id_t::frequent_depositor},
    grant_rule{"big_deposit",
               [](const deposit_facts& facts) {
                 return facts.amount >= kUnit * 5;
               },
               role_id_t::big_depositor},
    grant_rule{"participation",
               [](const deposit_facts& facts) {
                 return facts.amount > kUnit / 1000;
               },
               role_id_t::active_participant},
};

}  // namespace

role_grant_t classify(const deposit_facts& facts,
                      const timestamp_seconds_t now) {
  for (const auto& rule : kGrantRules) {
    if (!rule.matches(facts)) {
      continue;
    }
    spdlog::debug("Grant rule '{}' matched for amount {}", rule.name,
                  to_string(facts.amount));
    if (is_permanent(rule.role)) {
      return permanent_role_grant_t{.role = rule.role};
    }
    return temporary_role_grant_t{.role = rule.role,
                                  .expiry = now + kTemporaryRoleWindow};
  }
  return no_role_grant_t{};
}

role_grant_t role_engine::evaluate(journal& tx,
                                   const account_id_t& account,
                                   const deposit_facts& facts,
                                   const timestamp_seconds_t now) {
  auto grant = classify(facts, now);
  std::visit(overloaded{[&](const no_role_grant_t&) {
                          spdlog::debug("Deposit by {} earns no role",
                                        to_string(account));
                        },
                        [&](const permanent_role_grant_t& value) {
                          grant_permanent(tx, account, value.role);
                        },
                        [&](const temporary_role_grant_t&) {
                          grant_temporary(tx, account, now);
                        }},
             grant);
  return grant;
}

void role_engine::refresh_activity(journal& tx,
                                   const account_id_t& account,
                                   const timestamp_seconds_t now) {
  auto found = timed_roles_.find(account);
  if (found == std::end(timed_roles_) || !found->second.active) {
    return;
  }
  tx.on_rollback([this, account, previous = found->second] {
    timed_roles_[account] = previous;
  });
  found->second.last_active = now;
  found->second.expiry = now + kTemporaryRoleWindow;
}

bool role_engine::revoke_temporary_role(journal& tx,
                                        const account_id_t& account) {
  auto found = timed_roles_.find(account);
  if (found == std::end(timed_roles_) || !found->second.active) {
    return false;
  }
  tx.on_rollback([this, account, previous = found->second] {
    timed_roles_[account] = previous;
  });
  found->second.active = false;

  auto held = roles_.find(account);
  if (held != std::end(roles_) &&
      held->second.erase(role_id_t::active_participant) > 0) {
    if (held->second.empty()) {
      roles_.erase(held);
    }
    tx.on_rollback([this, account] {
      roles_[account].insert(role_id_t::active_participant);
    });
  }
  return true;
}

bool role_engine::has_role(const account_id_t& account,
                           const role_id_t role) const {
  auto found = roles_.find(account);
  return found != std::end(roles_) && found->second.contains(role);
}

std::vector<role_id_t> role_engine::roles(const account_id_t& account) const {
  auto found = roles_.find(account);
  if (found == std::end(roles_)) {
    return {};
  }
  return {std::begin(found->second), std::end(found->second)};
}

std::optional<timed_role_t> role_engine::timed_role(
    const account_id_t& account) const {
  auto found = timed_roles_.find(account);
  if (found == std::end(timed_roles_)) {
    return std::nullopt;
  }
  return found->second;
}

const std::vector<account_id_t>& role_engine::registry() const {
  return registry_;
}

void role_engine::restore_roles(const account_id_t& account,
                                const std::vector<role_id_t>& roles) {
  if (roles.empty()) {
    roles_.erase(account);
    return;
  }
  roles_[account] = std::set<role_id_t>{std::begin(roles), std::end(roles)};
}

void role_engine::restore_timed_role(const account_id_t& account,
                                     const timed_role_t& role) {
  timed_roles_[account] = role;
}

void role_engine::restore_registry(std::vector<account_id_t> accounts) {
  registry_ = std::move(accounts);
  registry_members_ =
      std::set<account_id_t>{std::begin(registry_), std::end(registry_)};
}

void role_engine::grant_permanent(journal& tx,
                                  const account_id_t& account,
                                  const role_id_t role) {
  if (has_role(account, role)) {
    spdlog::debug("{} already holds {}", to_string(account), to_string(role));
    return;
  }
  add_member(tx, account, role);
  tx.emit(transaction_event_t{
      .type = std::string{kRoleGrantedEventType},
      .attributes = {make_event_attribute("account", to_string(account), true),
                     make_event_attribute("role", std::string{to_string(role)},
                                          true)}});
  spdlog::info("Granted {} to {}", to_string(role), to_string(account));
}

void role_engine::grant_temporary(journal& tx,
                                  const account_id_t& account,
                                  const timestamp_seconds_t now) {
  auto [entry, inserted] = timed_roles_.try_emplace(account);
  tx.on_rollback(
      [this, account, inserted = inserted, previous = entry->second] {
        if (inserted) {
          timed_roles_.erase(account);
        } else {
          timed_roles_[account] = previous;
        }
      });
  entry->second.active = true;
  entry->second.last_active = now;
  entry->second.expiry = now + kTemporaryRoleWindow;

  if (!has_role(account, role_id_t::active_participant)) {
    add_member(tx, account, role_id_t::active_participant);
  }
  register_holder(tx, account);

  tx.emit(transaction_event_t{
      .type = std::string{kTemporaryRoleGrantedEventType},
      .attributes = {
          make_event_attribute("account", to_string(account), true),
          make_event_attribute(
              "role", std::string{to_string(role_id_t::active_participant)}),
          make_event_attribute("expiry",
                               std::to_string(entry->second.expiry))}});
  spdlog::debug("Temporary role for {} active until {}", to_string(account),
                entry->second.expiry);
}

void role_engine::add_member(journal& tx,
                             const account_id_t& account,
                             const role_id_t role) {
  roles_[account].insert(role);
  tx.on_rollback([this, account, role] {
    auto found = roles_.find(account);
    if (found == std::end(roles_)) {
      return;
    }
    found->second.erase(role);
    if (found->second.empty()) {
      roles_.erase(found);
    }
  });
}

void role_engine::register_holder(journal& tx, const account_id_t& account) {
  if (!registry_members_.insert(account).second) {
    return;
  }
  registry_.push_back(account);
  tx.on_rollback([this, account] {
    registry_.pop_back();
    registry_members_.erase(account);
  });
}

}  // namespace lockbox::execution
