#pragma once

#include <lockbox/schema/primitives.hpp>
#include <lockbox/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace lockbox::schema {

template <uint16_t Version>
struct transaction_result;

/// Result of a mutating engine call. `code` is zero on success or a
/// `transaction_error_code`; `data` carries the SCALE encoded return value.
template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace lockbox::schema
