#include <gtest/gtest.h>
#include <tally/ledger/asset_context.hpp>
#include <tally/ledger/balance_store.hpp>
#include <tally/ledger/codespace.hpp>
#include <tally/testing/state_fixture.hpp>

#include <memory>
#include <string>
#include <vector>

namespace {

using tally::schema::account_id_t;
using tally::schema::amount_t;
using tally::schema::ledger_error_code;

class airdrop_engine_test : public ::testing::Test {
 protected:
  airdrop_engine_test()
      : fixture{"tally_airdrop"},
        context{tally::schema::asset_state_t{
            .asset_id = tally::testing::make_hash(80),
            .administrator = admin(),
            .symbol = "TLY",
            .name = "Tally",
            .decimals = 0,
            .max_per_holder = 100,
            .paused = false}},
        state{fixture.stage()},
        balances{*state, context.asset().asset_id},
        alice{tally::testing::make_hash(2)},
        bob{tally::testing::make_hash(3)} {}

  static account_id_t admin() { return tally::testing::make_hash(1); }

  void set_gates(const bool airdrop, const bool whitelist) {
    context.features().store(
        *state, tally::schema::feature_state_t{.airdrop_enabled = airdrop,
                                               .whitelist_enabled = whitelist});
  }

  /// Open both gates, whitelist alice and bob, and fund the administrator.
  void prepare(const amount_t funding) {
    set_gates(true, true);
    ASSERT_TRUE(tally::schema::succeeded(
        context.whitelist().add_many(*state, {alice, bob})));
    ASSERT_TRUE(tally::schema::succeeded(
        context.token_ledger().mint(balances, admin(), admin(), funding)));
  }

  tally::schema::operation_result_t airdrop(
      const account_id_t& caller,
      const std::vector<account_id_t>& recipients,
      const std::vector<amount_t>& amounts) {
    return context.airdrops().airdrop(*state, balances, caller, recipients,
                                      amounts);
  }

  tally::testing::state_fixture fixture;
  tally::ledger::asset_context context;
  std::unique_ptr<tally::ledger::staged_state> state;
  tally::ledger::balance_store balances;
  account_id_t alice;
  account_id_t bob;
};

}  // namespace

TEST_F(airdrop_engine_test, distributes_from_administrator) {
  prepare(100);
  auto result = airdrop(admin(), {alice, bob}, {30, 20});
  ASSERT_TRUE(tally::schema::succeeded(result));
  EXPECT_EQ(balances.balance(admin()), 50u);
  EXPECT_EQ(balances.balance(alice), 30u);
  EXPECT_EQ(balances.balance(bob), 20u);
  EXPECT_EQ(balances.total_supply(), 100u);
}

TEST_F(airdrop_engine_test, authorization_precedes_gates) {
  auto result = airdrop(tally::testing::make_hash(9), {alice}, {1});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::permission_denied);
}

TEST_F(airdrop_engine_test, each_gate_is_required) {
  set_gates(false, true);
  EXPECT_EQ(tally::schema::error_code(airdrop(admin(), {}, {})),
            ledger_error_code::feature_inactive);

  set_gates(true, false);
  EXPECT_EQ(tally::schema::error_code(airdrop(admin(), {}, {})),
            ledger_error_code::feature_inactive);

  set_gates(true, true);
  EXPECT_TRUE(tally::schema::succeeded(airdrop(admin(), {}, {})));
}

TEST_F(airdrop_engine_test, gates_precede_length_check) {
  set_gates(false, false);
  EXPECT_EQ(tally::schema::error_code(airdrop(admin(), {alice, bob}, {1})),
            ledger_error_code::feature_inactive);

  set_gates(true, true);
  auto result = airdrop(admin(), {alice, bob}, {1});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::length_mismatch);
  EXPECT_EQ(result.codespace, tally::ledger::kAirdropCodespace);
}

TEST_F(airdrop_engine_test, unlisted_recipient_is_reported_by_index) {
  prepare(100);
  auto stranger = tally::testing::make_hash(4);
  auto result = airdrop(admin(), {alice, stranger}, {1, 1});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::not_whitelisted);
  EXPECT_EQ(result.info.rfind("recipient 1 ", 0), 0u);
}

TEST_F(airdrop_engine_test, cap_is_checked_before_zero_amount) {
  prepare(100);
  ASSERT_TRUE(tally::schema::succeeded(
      context.token_ledger().mint(balances, admin(), alice, 100)));

  auto result = airdrop(admin(), {alice}, {1});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::capacity_exceeded);
  EXPECT_EQ(result.info.rfind("recipient 0: ", 0), 0u);

  result = airdrop(admin(), {bob}, {0});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::invalid_amount);
  EXPECT_EQ(result.codespace, tally::ledger::kAirdropCodespace);
}

TEST_F(airdrop_engine_test, administrator_shortfall_names_failing_leg) {
  prepare(10);
  auto result = airdrop(admin(), {alice, bob}, {5, 10});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::insufficient_balance);
  EXPECT_EQ(result.info.rfind("recipient 1: ", 0), 0u);
}
