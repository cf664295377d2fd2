#pragma once

#include <tally/ledger/staged_state.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <tally/testing/common.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace tally::testing {

/// Temporary RocksDB database for exercising ledger components directly.
class state_fixture final {
 public:
  explicit state_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{tally::storage::make_storage<
            tally::storage::rocksdb_storage_tag>(db_path_)} {}

  state_fixture(const state_fixture&) = delete;
  state_fixture& operator=(const state_fixture&) = delete;

  ~state_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  tally::scale_encoder_t& encoder() { return encoder_; }
  tally::ledger::storage_t& storage() { return storage_; }

  /// A fresh overlay over the committed database.
  std::unique_ptr<tally::ledger::staged_state> stage() {
    return std::make_unique<tally::ledger::staged_state>(encoder_, storage_);
  }

 private:
  std::string db_path_;
  tally::scale_encoder_t encoder_;
  tally::ledger::storage_t storage_;
};

}  // namespace tally::testing
