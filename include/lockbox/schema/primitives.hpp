#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lockbox::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

inline constexpr duration_seconds_t kSecondsPerDay = 86'400;

/// Base units per whole currency unit (18 decimals).
inline const amount_t kUnit = amount_t{1'000'000'000'000'000'000ull};

std::string make_string(const bytes_t& bytes);

hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

/// Parse a 64 digit hex account identifier, optionally prefixed with `0x`.
std::optional<account_id_t> try_make_account_id(const std::string_view hex);
std::string to_string(const account_id_t& account);

/// Parse a non-negative decimal amount of base units.
///
/// Rejects empty input, signs, non-digits and values wider than 256 bits.
std::optional<amount_t> try_make_amount(const std::string_view decimal);
std::string to_string(const amount_t& amount);

}  // namespace lockbox::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
