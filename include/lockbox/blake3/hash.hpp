#pragma once
#include <lockbox/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace lockbox::blake3 {

lockbox::schema::hash32_t hash(const std::string_view& str);
lockbox::schema::hash32_t hash(const lockbox::schema::bytes_view_t& bytes);

}  // namespace lockbox::blake3
