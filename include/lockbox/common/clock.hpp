#pragma once

#include <lockbox/schema/primitives.hpp>
#include <chrono>
#include <functional>

namespace lockbox::common {

/// Source of the `now` timestamp handed to engine calls.
using now_source_t = std::function<lockbox::schema::timestamp_seconds_t()>;

inline lockbox::schema::timestamp_seconds_t system_now() {
  return static_cast<lockbox::schema::timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace lockbox::common
