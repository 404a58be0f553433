#pragma once

#include <lockbox/schema/primitives.hpp>
#include <lockbox/schema/transaction_event.hpp>
#include <cstdint>

// Schema type: event record.
// Persisted, sequence-numbered form of a committed event.
namespace lockbox::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  uint64_t operation{};
  timestamp_seconds_t timestamp{};
  transaction_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace lockbox::schema
