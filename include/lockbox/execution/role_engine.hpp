#pragma once

#include <lockbox/execution/journal.hpp>
#include <lockbox/schema/lock_period.hpp>
#include <lockbox/schema/primitives.hpp>
#include <lockbox/schema/role_grant.hpp>
#include <lockbox/schema/role_id.hpp>
#include <lockbox/schema/timed_role.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace lockbox::execution {

/// Facts about one deposit that the grant rules look at.
struct deposit_facts final {
  lockbox::schema::amount_t amount;
  lockbox::schema::lock_period_t period{};
  /// Slots the account owns after this deposit, withdrawn ones included.
  uint64_t deposit_count{};
};

/// Ordered grant rules; the first rule that matches decides the outcome.
lockbox::schema::role_grant_t classify(const deposit_facts& facts,
                                       lockbox::schema::timestamp_seconds_t now);

/// Issues roles from deposit behaviour and owns the temporary-role registry.
class role_engine final {
 public:
  /// Classify one deposit and apply the resulting grant.
  lockbox::schema::role_grant_t evaluate(
      journal& tx,
      const lockbox::schema::account_id_t& account,
      const deposit_facts& facts,
      lockbox::schema::timestamp_seconds_t now);

  /// Push the temporary role's expiry forward if it is active.
  void refresh_activity(journal& tx,
                        const lockbox::schema::account_id_t& account,
                        lockbox::schema::timestamp_seconds_t now);

  /// Deactivate the temporary role and drop its membership. Returns false
  /// when there was nothing active to revoke.
  bool revoke_temporary_role(journal& tx,
                             const lockbox::schema::account_id_t& account);

  bool has_role(const lockbox::schema::account_id_t& account,
                lockbox::schema::role_id_t role) const;
  std::vector<lockbox::schema::role_id_t> roles(
      const lockbox::schema::account_id_t& account) const;
  std::optional<lockbox::schema::timed_role_t> timed_role(
      const lockbox::schema::account_id_t& account) const;
  /// Every account that ever held the temporary role, in first-grant order.
  const std::vector<lockbox::schema::account_id_t>& registry() const;

  void restore_roles(const lockbox::schema::account_id_t& account,
                     const std::vector<lockbox::schema::role_id_t>& roles);
  void restore_timed_role(const lockbox::schema::account_id_t& account,
                          const lockbox::schema::timed_role_t& role);
  void restore_registry(std::vector<lockbox::schema::account_id_t> accounts);

 private:
  void grant_permanent(journal& tx,
                       const lockbox::schema::account_id_t& account,
                       lockbox::schema::role_id_t role);
  void grant_temporary(journal& tx,
                       const lockbox::schema::account_id_t& account,
                       lockbox::schema::timestamp_seconds_t now);
  void add_member(journal& tx,
                  const lockbox::schema::account_id_t& account,
                  lockbox::schema::role_id_t role);
  void register_holder(journal& tx,
                       const lockbox::schema::account_id_t& account);

  std::map<lockbox::schema::account_id_t, std::set<lockbox::schema::role_id_t>>
      roles_;
  std::map<lockbox::schema::account_id_t, lockbox::schema::timed_role_t>
      timed_roles_;
  std::vector<lockbox::schema::account_id_t> registry_;
  std::set<lockbox::schema::account_id_t> registry_members_;
};

}  // namespace lockbox::execution
