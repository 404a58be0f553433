#pragma once
#include <lockbox/schema/primitives.hpp>
#include <optional>
#include <span>

namespace lockbox::schema::encoding {

// The wire/storage codec is picked at build time through the tag type so the
// engine and storage never name the codec library directly.
template <typename Library>
struct encoder {
  template <typename T>
  lockbox::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, lockbox::schema::bytes_t& out);

  template <typename T>
  T decode(const lockbox::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const lockbox::schema::bytes_view_t& bytes);
};

}  // namespace lockbox::schema::encoding
