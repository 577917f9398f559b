#pragma once
#include <credo/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace credo::storage {

using key_value_entry_t =
    std::pair<credo::schema::bytes_t, credo::schema::bytes_t>;

/// One row of an atomic write. An empty value deletes the key.
using write_entry_t =
    std::pair<credo::schema::bytes_t, std::optional<credo::schema::bytes_t>>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const credo::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const credo::schema::bytes_view_t& key,
           const T& value);

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<credo::schema::bytes_t> get_raw(
      const credo::schema::bytes_view_t& key) const;

  /// Apply every entry in one atomic batch.
  void write(const std::vector<write_entry_t>& entries);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const credo::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace credo::storage
