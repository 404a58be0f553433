#pragma once

#include <lockbox/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Staking workflow: reputation markers issued from deposit behaviour. The
// first three are permanent; active_participant is temporary and lapses
// without activity.
namespace lockbox::schema {

enum class role_id_t : uint8_t {
  long_term_committer = 0,
  frequent_depositor = 1,
  big_depositor = 2,
  active_participant = 3
};

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"long_term_committer",
                                           role_id_t::long_term_committer},
    std::pair<std::string_view, role_id_t>{"frequent_depositor",
                                           role_id_t::frequent_depositor},
    std::pair<std::string_view, role_id_t>{"big_depositor",
                                           role_id_t::big_depositor},
    std::pair<std::string_view, role_id_t>{"active_participant",
                                           role_id_t::active_participant},
};

inline constexpr bool is_permanent(const role_id_t role) {
  return role != role_id_t::active_participant;
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

}  // namespace lockbox::schema
