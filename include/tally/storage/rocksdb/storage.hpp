#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tally/common/critical.hpp>
#include <tally/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace tally::storage {

namespace detail {

inline tally::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tally::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<tally::schema::bytes_t> get_bytes(
      const tally::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix) const;
  void write_batch(const std::vector<write_entry>& entries) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<tally::schema::bytes_t>
storage<rocksdb_storage_tag>::get_bytes(
    const tally::schema::bytes_view_t& key) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    tally::common::critical("Failed to get value from RocksDB");
  }
  return tally::schema::bytes_t(std::begin(value), std::end(value));
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tally::schema::bytes_view_t& key) const {
  auto value = get_bytes(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      tally::schema::bytes_view_t{value->data(), value->size()})};
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const tally::schema::bytes_view_t& prefix) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    tally::common::critical("failed to list keys by prefix");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::write_batch(
    const std::vector<write_entry>& entries) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  if (entries.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& entry : entries) {
    auto key = detail::to_slice(
        tally::schema::bytes_view_t{entry.key.data(), entry.key.size()});
    auto status = entry.value
                      ? batch.Put(key, detail::to_slice(tally::schema::bytes_view_t{
                                           entry.value->data(),
                                           entry.value->size()}))
                      : batch.Delete(key);
    if (!status.ok()) {
      tally::common::critical("failed staging key in write batch");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto write_status = database->Write(write_options, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}",
                  write_status.ToString());
    tally::common::critical("failed to commit write batch");
  }
}

}  // namespace tally::storage
