#include <gtest/gtest.h>
#include <tally/ledger/feature_flags.hpp>
#include <tally/ledger/whitelist_registry.hpp>
#include <tally/testing/state_fixture.hpp>

#include <vector>

namespace {

using tally::schema::account_id_t;
using tally::schema::ledger_error_code;

class whitelist_registry_test : public ::testing::Test {
 protected:
  whitelist_registry_test()
      : fixture{"tally_whitelist"},
        asset{tally::testing::make_hash(50)},
        flags{asset},
        registry{asset, flags} {}

  void set_whitelist_gate(const bool enabled) {
    auto state = fixture.stage();
    flags.store(*state, tally::schema::feature_state_t{
                            .airdrop_enabled = false,
                            .whitelist_enabled = enabled});
    state->commit();
  }

  tally::testing::state_fixture fixture;
  tally::schema::asset_id_t asset;
  tally::ledger::feature_flags flags;
  tally::ledger::whitelist_registry registry;
};

}  // namespace

TEST_F(whitelist_registry_test, empty_list_is_rejected_before_gate_check) {
  auto state = fixture.stage();
  auto result = registry.add_many(*state, {});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::invalid_address_list);
  result = registry.remove_many(*state, {});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::invalid_address_list);
}

TEST_F(whitelist_registry_test, closed_gate_rejects_updates) {
  auto state = fixture.stage();
  auto result = registry.add_many(*state, {tally::testing::make_hash(1)});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::feature_inactive);
  EXPECT_EQ(state->pending_writes(), 0u);
}

TEST_F(whitelist_registry_test, add_then_remove_round_trips_membership) {
  set_whitelist_gate(true);
  auto a = tally::testing::make_hash(1);
  auto b = tally::testing::make_hash(2);

  auto state = fixture.stage();
  EXPECT_TRUE(tally::schema::succeeded(registry.add_many(*state, {a, b})));
  EXPECT_TRUE(registry.contains(*state, a));
  EXPECT_TRUE(registry.contains(*state, b));
  EXPECT_EQ(registry.members(*state).size(), 2u);

  EXPECT_TRUE(tally::schema::succeeded(registry.remove_many(*state, {a})));
  EXPECT_FALSE(registry.contains(*state, a));
  EXPECT_EQ(registry.members(*state), std::vector<account_id_t>{b});
}

TEST_F(whitelist_registry_test, duplicate_add_reports_offending_entry) {
  set_whitelist_gate(true);
  auto a = tally::testing::make_hash(1);
  {
    auto state = fixture.stage();
    ASSERT_TRUE(tally::schema::succeeded(registry.add_many(*state, {a})));
    state->commit();
  }

  auto state = fixture.stage();
  auto result =
      registry.add_many(*state, {tally::testing::make_hash(9), a});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::already_whitelisted);
  EXPECT_NE(result.info.find("entry 1"), std::string::npos);
}

TEST_F(whitelist_registry_test, repeated_identity_in_one_call_is_rejected) {
  set_whitelist_gate(true);
  auto a = tally::testing::make_hash(1);
  auto state = fixture.stage();
  auto result = registry.add_many(*state, {a, a});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::already_whitelisted);
}

TEST_F(whitelist_registry_test, removing_non_member_fails) {
  set_whitelist_gate(true);
  auto state = fixture.stage();
  auto result = registry.remove_many(*state, {tally::testing::make_hash(3)});
  EXPECT_EQ(tally::schema::error_code(result),
            ledger_error_code::not_whitelisted);
  EXPECT_EQ(result.codespace, "tally.whitelist");
}
