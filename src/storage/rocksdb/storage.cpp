#include <tally/common/critical.hpp>
#include <tally/storage/rocksdb/storage.hpp>

namespace tally::storage {
template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  // A ledger is one small keyspace with a single writer. Corruption must stop
  // the process rather than be skipped.
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.max_open_files = 64;
  options.OptimizeForSmallDb();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open ledger database at '{}': {}", path,
                  status.ToString());
    tally::common::critical("cannot open ledger database");
  }
  spdlog::debug("Opened ledger database at '{}'", path);
  store.database.reset(database);

  return store;
}
}  // namespace tally::storage
