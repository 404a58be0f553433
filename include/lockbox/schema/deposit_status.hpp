#pragma once

#include <lockbox/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace lockbox::schema {

enum class deposit_status_t : uint8_t { locked = 0, unlocked = 1 };

inline constexpr auto kDepositStatusMappings = std::array{
    std::pair<std::string_view, deposit_status_t>{"locked",
                                                  deposit_status_t::locked},
    std::pair<std::string_view, deposit_status_t>{"unlocked",
                                                  deposit_status_t::unlocked},
};

inline constexpr std::string_view to_string(const deposit_status_t value) {
  return to_string(value, kDepositStatusMappings).value_or("unknown");
}

}  // namespace lockbox::schema
