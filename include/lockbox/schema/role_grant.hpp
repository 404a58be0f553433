#pragma once
#include <lockbox/schema/primitives.hpp>
#include <lockbox/schema/role_id.hpp>
#include <variant>

namespace lockbox::schema {

struct no_role_grant_t final {};

struct permanent_role_grant_t final {
  role_id_t role{};
};

struct temporary_role_grant_t final {
  role_id_t role{role_id_t::active_participant};
  timestamp_seconds_t expiry{};
};

/// Outcome of evaluating one deposit against the grant rules. At most one
/// role is issued per deposit.
using role_grant_t =
    std::variant<no_role_grant_t, permanent_role_grant_t, temporary_role_grant_t>;

}  // namespace lockbox::schema
