#pragma once
#include <credo/schema/primitives.hpp>
#include <optional>
#include <span>

namespace credo::schema::encoding {

// The codec is a build-time choice: callers name a library tag and get the
// matching specialization. Every stored value, storage key, signed message
// and encoded operation goes through it, so two nodes built with the same tag
// agree byte for byte.
template <typename Library>
struct encoder {
  template <typename T>
  credo::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, credo::schema::bytes_t& out);

  template <typename T>
  T decode(const credo::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const credo::schema::bytes_view_t& bytes);
};

}  // namespace credo::schema::encoding
