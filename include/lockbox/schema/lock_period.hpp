#pragma once

#include <lockbox/schema/enum_string.hpp>
#include <lockbox/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: lock period.
// Staking workflow: the three fixed commitment durations a deposit may be
// locked for. Durations are matched exactly; there is no range tolerance.
namespace lockbox::schema {

enum class lock_period_t : uint8_t {
  short_term = 0,
  medium_term = 1,
  long_term = 2
};

inline constexpr duration_seconds_t kShortLockDuration = 180 * kSecondsPerDay;
inline constexpr duration_seconds_t kMediumLockDuration = 365 * kSecondsPerDay;
inline constexpr duration_seconds_t kLongLockDuration =
    5 * 365 * kSecondsPerDay;

inline constexpr auto kLockPeriodMappings = std::array{
    std::pair<std::string_view, lock_period_t>{"short", lock_period_t::short_term},
    std::pair<std::string_view, lock_period_t>{"medium",
                                               lock_period_t::medium_term},
    std::pair<std::string_view, lock_period_t>{"long", lock_period_t::long_term},
};

inline constexpr duration_seconds_t duration_of(const lock_period_t period) {
  switch (period) {
    case lock_period_t::short_term:
      return kShortLockDuration;
    case lock_period_t::medium_term:
      return kMediumLockDuration;
    case lock_period_t::long_term:
      return kLongLockDuration;
  }
  return 0;
}

/// Map a duration in seconds onto one of the canonical lock periods.
inline constexpr std::optional<lock_period_t> try_lock_period(
    const duration_seconds_t duration) {
  for (const auto& [name, period] : kLockPeriodMappings) {
    if (duration_of(period) == duration) {
      return period;
    }
  }
  return std::nullopt;
}

inline constexpr std::string_view to_string(const lock_period_t value) {
  return to_string(value, kLockPeriodMappings).value_or("unknown");
}

}  // namespace lockbox::schema
