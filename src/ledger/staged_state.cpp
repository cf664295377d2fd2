#include <tally/ledger/staged_state.hpp>

#include <algorithm>
#include <iterator>

using namespace tally::schema;

namespace tally::ledger {

namespace {

bool has_prefix(const bytes_t& key, const bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace

staged_state::staged_state(scale_encoder_t& encoder, const storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<bytes_t> staged_state::get_bytes(const bytes_view_t& key) const {
  auto staged = pending_.find(make_bytes(key));
  if (staged != std::end(pending_)) {
    return staged->second;
  }
  return storage_.get_bytes(key);
}

bool staged_state::contains(const bytes_view_t& key) const {
  return get_bytes(key).has_value();
}

void staged_state::erase(const bytes_view_t& key) {
  pending_.insert_or_assign(make_bytes(key), std::nullopt);
}

std::vector<tally::storage::key_value_entry_t> staged_state::list_by_prefix(
    const bytes_view_t& prefix) const {
  auto merged = std::map<bytes_t, bytes_t>{};
  for (auto& [key, value] : storage_.list_by_prefix(prefix)) {
    merged.insert_or_assign(std::move(key), std::move(value));
  }

  for (auto it = pending_.lower_bound(make_bytes(prefix));
       it != std::end(pending_) && has_prefix(it->first, prefix); ++it) {
    if (it->second) {
      merged.insert_or_assign(it->first, *it->second);
    } else {
      merged.erase(it->first);
    }
  }

  auto entries = std::vector<tally::storage::key_value_entry_t>{};
  entries.reserve(merged.size());
  for (auto& [key, value] : merged) {
    entries.emplace_back(key, std::move(value));
  }
  return entries;
}

std::size_t staged_state::pending_writes() const {
  return pending_.size();
}

void staged_state::commit() {
  auto entries = std::vector<tally::storage::write_entry>{};
  entries.reserve(pending_.size());
  for (const auto& [key, value] : pending_) {
    entries.push_back(tally::storage::write_entry{.key = key, .value = value});
  }
  storage_.write_batch(entries);
  pending_.clear();
}

}  // namespace tally::ledger
