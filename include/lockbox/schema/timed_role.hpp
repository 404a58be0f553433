#pragma once
#include <lockbox/schema/primitives.hpp>
#include <cstdint>

namespace lockbox::schema {

/// Inactivity window after which a temporary role lapses.
inline constexpr duration_seconds_t kTemporaryRoleWindow = 8 * kSecondsPerDay;

template <uint16_t Version>
struct timed_role;

/// One temporary role instance. Never deleted; the sweep only clears
/// `active`, and a later qualifying deposit sets it again.
template <>
struct timed_role<1> final {
  uint16_t version{1};
  bool active{};
  timestamp_seconds_t last_active{};
  timestamp_seconds_t expiry{};

  bool operator==(const timed_role<1>&) const = default;
};

using timed_role_t = timed_role<1>;

}  // namespace lockbox::schema
