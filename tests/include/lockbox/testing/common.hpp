#pragma once

#include <lockbox/schema/lock_period.hpp>
#include <lockbox/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace lockbox::testing {

inline constexpr lockbox::schema::timestamp_seconds_t kGenesisTime =
    1'700'000'000;

inline lockbox::schema::account_id_t make_account(const uint8_t seed) {
  auto out = lockbox::schema::account_id_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Distinct account per index, for scenarios with hundreds of accounts.
inline lockbox::schema::account_id_t make_indexed_account(const uint32_t index) {
  auto out = lockbox::schema::account_id_t{};
  out[0] = 0xA5;
  out[28] = static_cast<uint8_t>(index >> 24u);
  out[29] = static_cast<uint8_t>(index >> 16u);
  out[30] = static_cast<uint8_t>(index >> 8u);
  out[31] = static_cast<uint8_t>(index);
  return out;
}

/// `whole` units plus `base` base units.
inline lockbox::schema::amount_t units(const uint64_t whole,
                                       const uint64_t base = 0) {
  return lockbox::schema::kUnit * whole + base;
}

inline lockbox::schema::duration_seconds_t days(const uint64_t count) {
  return count * lockbox::schema::kSecondsPerDay;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace lockbox::testing
