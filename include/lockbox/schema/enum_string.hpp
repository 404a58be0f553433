#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace lockbox::schema {

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

}  // namespace lockbox::schema
