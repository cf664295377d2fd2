#pragma once
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <vector>

namespace tally::ledger {

using storage_t = tally::storage::storage<tally::storage::rocksdb_storage_tag>;

/// Write overlay over committed storage for the duration of one operation.
///
/// Reads observe staged writes first. Nothing reaches storage until commit(),
/// which flushes every staged write as a single batch. Dropping the object
/// without committing discards all of them.
class staged_state final {
 public:
  staged_state(scale_encoder_t& encoder, const storage_t& storage);

  staged_state(const staged_state&) = delete;
  staged_state& operator=(const staged_state&) = delete;
  staged_state(staged_state&&) = delete;
  staged_state& operator=(staged_state&&) = delete;
  ~staged_state() = default;

  std::optional<tally::schema::bytes_t> get_bytes(
      const tally::schema::bytes_view_t& key) const;
  bool contains(const tally::schema::bytes_view_t& key) const;

  /// Decode the value at key. Undecodable records are fatal.
  template <typename T>
  std::optional<T> get(const tally::schema::bytes_view_t& key) const;

  template <typename T>
  void put(const tally::schema::bytes_view_t& key, const T& value);

  void erase(const tally::schema::bytes_view_t& key);

  /// Merged view of committed and staged entries under prefix, in key order.
  std::vector<tally::storage::key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;

  std::size_t pending_writes() const;
  void commit();

  scale_encoder_t& encoder() const { return encoder_; }

 private:
  scale_encoder_t& encoder_;
  const storage_t& storage_;
  std::map<tally::schema::bytes_t, std::optional<tally::schema::bytes_t>>
      pending_;
};

template <typename T>
std::optional<T> staged_state::get(
    const tally::schema::bytes_view_t& key) const {
  auto staged = pending_.find(tally::schema::make_bytes(key));
  if (staged == std::end(pending_)) {
    return storage_.get<T>(encoder_, key);
  }
  if (!staged->second) {
    return std::nullopt;
  }
  return encoder_.decode<T>(tally::schema::bytes_view_t{
      staged->second->data(), staged->second->size()});
}

template <typename T>
void staged_state::put(const tally::schema::bytes_view_t& key,
                       const T& value) {
  pending_.insert_or_assign(tally::schema::make_bytes(key),
                            encoder_.encode(value));
}

}  // namespace tally::ledger
