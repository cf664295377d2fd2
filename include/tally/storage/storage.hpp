#pragma once
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace tally::storage {

using key_value_entry_t =
    std::pair<tally::schema::bytes_t, tally::schema::bytes_t>;

/// One staged mutation. An empty `value` deletes the key.
struct write_entry final {
  tally::schema::bytes_t key;
  std::optional<tally::schema::bytes_t> value;
};

template <typename Library>
struct storage {
  /// Return the raw value at key, or std::nullopt when missing.
  std::optional<tally::schema::bytes_t> get_bytes(
      const tally::schema::bytes_view_t& key) const;

  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;

  /// Apply every entry or none of them. This is the only write path.
  void write_batch(const std::vector<write_entry>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tally::storage
