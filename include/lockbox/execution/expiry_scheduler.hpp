#pragma once

#include <lockbox/execution/journal.hpp>
#include <lockbox/execution/role_engine.hpp>
#include <lockbox/schema/primitives.hpp>
#include <lockbox/schema/probe_result.hpp>
#include <cstddef>
#include <vector>

namespace lockbox::execution {

/// Largest number of accounts one probe reports and one sweep processes.
inline constexpr std::size_t kSweepBatchLimit = 100;

/// Probe/sweep pair driven by an external trigger.
///
/// `probe` is read-only and may be called speculatively. `sweep` deactivates
/// lapsed temporary roles and is idempotent per entry. Neither call ever
/// schedules itself; a registry larger than the batch limit needs several
/// probe/sweep rounds.
class expiry_scheduler final {
 public:
  explicit expiry_scheduler(role_engine& roles,
                            std::size_t batch_limit = kSweepBatchLimit);

  lockbox::schema::probe_result_t probe(
      lockbox::schema::timestamp_seconds_t now) const;

  /// Returns the accounts that were actually deactivated.
  std::vector<lockbox::schema::account_id_t> sweep(
      journal& tx,
      const std::vector<lockbox::schema::account_id_t>& candidates,
      lockbox::schema::timestamp_seconds_t now);

  std::size_t batch_limit() const;

 private:
  bool is_lapsed(const lockbox::schema::account_id_t& account,
                 lockbox::schema::timestamp_seconds_t now) const;

  role_engine& roles_;
  std::size_t batch_limit_;
};

}  // namespace lockbox::execution
