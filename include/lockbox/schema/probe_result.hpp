#pragma once
#include <lockbox/schema/primitives.hpp>
#include <cstdint>
#include <vector>

namespace lockbox::schema {

template <uint16_t Version>
struct probe_result;

template <>
struct probe_result<1> final {
  uint16_t version{1};
  bool work_needed{};
  std::vector<account_id_t> candidates;
};

using probe_result_t = probe_result<1>;

}  // namespace lockbox::schema
