#pragma once

namespace tally::ledger {

class asset_context;
class capability_set;

/// Authority to create units. Only a capability_set can hold one.
class mint_capability final {
 public:
  mint_capability(const mint_capability&) = delete;
  mint_capability& operator=(const mint_capability&) = delete;
  mint_capability(mint_capability&&) = delete;
  mint_capability& operator=(mint_capability&&) = delete;
  ~mint_capability() = default;

 private:
  friend class capability_set;
  mint_capability() = default;
};

/// Authority to move units between arbitrary holders.
class transfer_capability final {
 public:
  transfer_capability(const transfer_capability&) = delete;
  transfer_capability& operator=(const transfer_capability&) = delete;
  transfer_capability(transfer_capability&&) = delete;
  transfer_capability& operator=(transfer_capability&&) = delete;
  ~transfer_capability() = default;

 private:
  friend class capability_set;
  transfer_capability() = default;
};

/// Authority to destroy units.
class burn_capability final {
 public:
  burn_capability(const burn_capability&) = delete;
  burn_capability& operator=(const burn_capability&) = delete;
  burn_capability(burn_capability&&) = delete;
  burn_capability& operator=(burn_capability&&) = delete;
  ~burn_capability() = default;

 private:
  friend class capability_set;
  burn_capability() = default;
};

/// The asset's privileged tokens.
///
/// Created by asset_context together with the asset record and kept for the
/// asset's lifetime. Callers only ever borrow it through
/// authorization_guard::require_admin.
class capability_set final {
 public:
  capability_set(const capability_set&) = delete;
  capability_set& operator=(const capability_set&) = delete;
  capability_set(capability_set&&) = delete;
  capability_set& operator=(capability_set&&) = delete;
  ~capability_set() = default;

  const mint_capability mint;
  const transfer_capability transfer;
  const burn_capability burn;

 private:
  friend class asset_context;
  capability_set() : mint{}, transfer{}, burn{} {}
};

}  // namespace tally::ledger
