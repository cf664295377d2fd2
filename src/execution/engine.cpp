#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <tally/execution/engine.hpp>
#include <tally/ledger/asset_context.hpp>
#include <tally/ledger/authorization_guard.hpp>
#include <tally/ledger/balance_store.hpp>
#include <tally/ledger/codespace.hpp>
#include <tally/schema/key/ledger_keys.hpp>
#include <utility>

using namespace tally::schema;

namespace tally::execution {

engine::engine(tally::scale_encoder_t& encoder,
               tally::ledger::storage_t& storage)
    : encoder_{encoder}, storage_{storage} {
  spdlog::info("Initializing ledger engine");
  load_persisted_state();
  if (asset_) {
    spdlog::info("Ledger engine ready for asset {} ({})",
                 asset_->asset().symbol, to_hex(asset_->asset().asset_id));
  } else {
    spdlog::info("Ledger engine ready; no asset initialized");
  }
}

engine::~engine() = default;

operation_result_t engine::initialize(const account_id_t& administrator,
                                      const asset_options_t& options) {
  auto lock = std::scoped_lock{mutex_};
  if (asset_) {
    spdlog::warn("Rejecting initialize: asset {} already exists",
                 asset_->asset().symbol);
    return make_error_result(
        ledger_error_code::already_initialized,
        fmt::format("asset {} already exists", asset_->asset().symbol),
        ledger::kEngineCodespace);
  }
  if (options.max_per_holder == 0) {
    spdlog::warn("Rejecting initialize: holder cap is zero");
    return make_error_result(ledger_error_code::invalid_amount,
                             "holder cap must be positive",
                             ledger::kEngineCodespace);
  }

  auto asset = asset_state_t{
      .asset_id = key::derive_asset_id(administrator, options.symbol),
      .administrator = administrator,
      .symbol = options.symbol,
      .name = options.name,
      .decimals = options.decimals,
      .max_per_holder = options.max_per_holder,
      .paused = false};
  auto context = std::make_unique<ledger::asset_context>(asset);

  auto state = ledger::staged_state{encoder_, storage_};
  auto asset_key = key::make_asset_state_key();
  state.put(make_bytes_view(asset_key), encoding::scale::to_record(asset));
  context->features().store(state, feature_state_t{});
  state.commit();

  asset_ = std::move(context);
  spdlog::info("Initialized asset {} ({}) with holder cap {}", asset.symbol,
               to_hex(asset.asset_id), asset.max_per_holder);
  return {};
}

operation_result_t engine::set_features(const account_id_t& caller,
                                        const bool airdrop_enabled,
                                        const bool whitelist_enabled) {
  auto lock = std::scoped_lock{mutex_};
  return execute("set_features", [&](ledger::staged_state& state,
                                     ledger::balance_store&) {
    if (!asset_->guard().require_admin(caller)) {
      return ledger::authorization_guard::permission_denied(caller);
    }
    asset_->features().store(
        state, feature_state_t{.airdrop_enabled = airdrop_enabled,
                               .whitelist_enabled = whitelist_enabled});
    spdlog::info("Feature gates set: airdrop={}, whitelist={}",
                 airdrop_enabled, whitelist_enabled);
    return operation_result_t{};
  });
}

operation_result_t engine::get_features(const account_id_t& caller,
                                        feature_state_t& features) const {
  auto lock = std::scoped_lock{mutex_};
  return inspect("get_features", [&](const ledger::staged_state& state) {
    if (!asset_->guard().require_admin(caller)) {
      return ledger::authorization_guard::permission_denied(caller);
    }
    features = asset_->features().load(state);
    return operation_result_t{};
  });
}

operation_result_t engine::is_whitelisted(const account_id_t& caller,
                                          const account_id_t& identity,
                                          bool& member) const {
  auto lock = std::scoped_lock{mutex_};
  return inspect("is_whitelisted", [&](const ledger::staged_state& state) {
    if (!asset_->guard().require_admin(caller)) {
      return ledger::authorization_guard::permission_denied(caller);
    }
    member = asset_->whitelist().contains(state, identity);
    return operation_result_t{};
  });
}

operation_result_t engine::update_whitelist(
    const account_id_t& caller,
    const std::vector<account_id_t>& identities,
    const bool add) {
  auto lock = std::scoped_lock{mutex_};
  return execute(add ? "whitelist_add" : "whitelist_remove",
                 [&](ledger::staged_state& state, ledger::balance_store&) {
                   if (!asset_->guard().require_admin(caller)) {
                     return ledger::authorization_guard::permission_denied(
                         caller);
                   }
                   return add
                              ? asset_->whitelist().add_many(state, identities)
                              : asset_->whitelist().remove_many(state,
                                                                identities);
                 });
}

operation_result_t engine::list_whitelist(
    const account_id_t& caller,
    std::vector<account_id_t>& members) const {
  auto lock = std::scoped_lock{mutex_};
  return inspect("list_whitelist", [&](const ledger::staged_state& state) {
    if (!asset_->guard().require_admin(caller)) {
      return ledger::authorization_guard::permission_denied(caller);
    }
    members = asset_->whitelist().members(state);
    return operation_result_t{};
  });
}

operation_result_t engine::mint(const account_id_t& caller,
                                const account_id_t& to,
                                const amount_t amount) {
  auto lock = std::scoped_lock{mutex_};
  return execute("mint", [&](ledger::staged_state&,
                             ledger::balance_store& balances) {
    return asset_->token_ledger().mint(balances, caller, to, amount);
  });
}

operation_result_t engine::transfer(const account_id_t& caller,
                                    const account_id_t& from,
                                    const account_id_t& to,
                                    const amount_t amount) {
  auto lock = std::scoped_lock{mutex_};
  return execute("transfer", [&](ledger::staged_state&,
                                 ledger::balance_store& balances) {
    return asset_->token_ledger().transfer(balances, caller, from, to,
                                           amount);
  });
}

operation_result_t engine::burn(const account_id_t& caller,
                                const account_id_t& from,
                                const amount_t amount) {
  auto lock = std::scoped_lock{mutex_};
  return execute("burn", [&](ledger::staged_state&,
                             ledger::balance_store& balances) {
    return asset_->token_ledger().burn(balances, caller, from, amount);
  });
}

operation_result_t engine::airdrop(const account_id_t& caller,
                                   const std::vector<account_id_t>& recipients,
                                   const std::vector<amount_t>& amounts) {
  auto lock = std::scoped_lock{mutex_};
  return execute("airdrop", [&](ledger::staged_state& state,
                                ledger::balance_store& balances) {
    return asset_->airdrops().airdrop(state, balances, caller, recipients,
                                      amounts);
  });
}

amount_t engine::get_balance(const account_id_t& identity) const {
  auto lock = std::scoped_lock{mutex_};
  if (!asset_) {
    return 0;
  }
  auto state = ledger::staged_state{encoder_, storage_};
  return ledger::balance_store{state, asset_->asset().asset_id}.balance(
      identity);
}

amount_t engine::total_supply() const {
  auto lock = std::scoped_lock{mutex_};
  if (!asset_) {
    return 0;
  }
  auto state = ledger::staged_state{encoder_, storage_};
  return ledger::balance_store{state, asset_->asset().asset_id}.total_supply();
}

std::optional<asset_state_t> engine::get_metadata() const {
  auto lock = std::scoped_lock{mutex_};
  if (!asset_) {
    return std::nullopt;
  }
  return asset_->asset();
}

template <typename Operation>
operation_result_t engine::execute(const std::string_view name,
                                   Operation&& operation) {
  if (!asset_) {
    spdlog::warn("Rejecting {}: no asset initialized", name);
    return asset_missing();
  }

  auto state = ledger::staged_state{encoder_, storage_};
  auto balances = ledger::balance_store{state, asset_->asset().asset_id};
  auto result = operation(state, balances);
  if (!succeeded(result)) {
    spdlog::warn("Rejecting {}: {} [{}] {}", name, result.log,
                 result.codespace, result.info);
    return result;
  }

  auto writes = state.pending_writes();
  state.commit();
  spdlog::debug("Committed {} with {} write(s)", name, writes);
  return result;
}

template <typename Operation>
operation_result_t engine::inspect(const std::string_view name,
                                   Operation&& operation) const {
  if (!asset_) {
    spdlog::warn("Rejecting {}: no asset initialized", name);
    return asset_missing();
  }

  auto state = ledger::staged_state{encoder_, storage_};
  auto result = operation(static_cast<const ledger::staged_state&>(state));
  if (!succeeded(result)) {
    spdlog::warn("Rejecting {}: {} [{}] {}", name, result.log,
                 result.codespace, result.info);
  }
  return result;
}

operation_result_t engine::asset_missing() const {
  return make_error_result(ledger_error_code::asset_missing,
                           "no asset has been initialized",
                           ledger::kEngineCodespace);
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted asset state");
  auto state = ledger::staged_state{encoder_, storage_};
  auto asset_key = key::make_asset_state_key();
  auto record = state.get<encoding::scale::asset_state_record_t>(
      make_bytes_view(asset_key));
  if (!record) {
    return;
  }
  asset_ = std::make_unique<ledger::asset_context>(
      encoding::scale::from_record(*record));
}

}  // namespace tally::execution
