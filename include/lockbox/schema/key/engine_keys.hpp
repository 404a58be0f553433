#pragma once

#include <lockbox/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for ledger rows, role rows, the
// temporary-role registry and the committed event log.
namespace lockbox::schema::key {

inline constexpr std::string_view kDepositsKeyPrefix{"SYS|STATE|DEPOSITS|"};
inline constexpr std::string_view kLifetimeKeyPrefix{"SYS|STATE|LIFETIME|"};
inline constexpr std::string_view kTotalLockedKeyPrefix{
    "SYS|STATE|TOTAL_LOCKED|"};
inline constexpr std::string_view kRolesKeyPrefix{"SYS|STATE|ROLES|"};
inline constexpr std::string_view kTimedRoleKeyPrefix{"SYS|STATE|TIMED_ROLE|"};
inline constexpr std::string_view kRegistryKeyPrefix{
    "SYS|STATE|TEMP_REGISTRY|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
lockbox::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                           std::string_view prefix,
                                           const T& id) {
  // SCALE product types are encoded as concatenated field bytes, so this is
  // the same as encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
lockbox::schema::bytes_t make_prefix_key(Encoder& encoder,
                                         std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
lockbox::schema::bytes_t make_deposits_key(
    Encoder& encoder,
    const lockbox::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kDepositsKeyPrefix, account);
}

template <typename Encoder>
lockbox::schema::bytes_t make_lifetime_key(
    Encoder& encoder,
    const lockbox::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kLifetimeKeyPrefix, account);
}

template <typename Encoder>
lockbox::schema::bytes_t make_total_locked_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kTotalLockedKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
lockbox::schema::bytes_t make_roles_key(
    Encoder& encoder,
    const lockbox::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kRolesKeyPrefix, account);
}

template <typename Encoder>
lockbox::schema::bytes_t make_timed_role_key(
    Encoder& encoder,
    const lockbox::schema::account_id_t& account) {
  return make_prefixed_key(encoder, kTimedRoleKeyPrefix, account);
}

template <typename Encoder>
lockbox::schema::bytes_t make_registry_key(Encoder& encoder,
                                           uint64_t position) {
  return make_prefixed_key(encoder, kRegistryKeyPrefix, position);
}

template <typename Encoder>
lockbox::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
lockbox::schema::bytes_t make_event_key(Encoder& encoder, uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix, sequence);
}

/// Recover the account id from a per-account row key under `prefix`.
template <typename Encoder>
std::optional<lockbox::schema::account_id_t> parse_account_key(
    Encoder& encoder,
    std::string_view prefix,
    const lockbox::schema::bytes_view_t& key) {
  auto decoded = encoder.template try_decode<
      std::tuple<std::string, lockbox::schema::account_id_t>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != prefix) {
    return std::nullopt;
  }
  return std::get<1>(decoded.value());
}

}  // namespace lockbox::schema::key
