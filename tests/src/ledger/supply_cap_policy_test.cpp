#include <gtest/gtest.h>
#include <tally/ledger/supply_cap_policy.hpp>
#include <tally/testing/common.hpp>

#include <limits>

TEST(supply_cap_policy, accepts_up_to_the_cap) {
  auto policy = tally::ledger::supply_cap_policy{100};
  auto holder = tally::testing::make_hash(4);
  EXPECT_TRUE(tally::schema::succeeded(policy.check_cap(holder, 0, 100)));
  EXPECT_TRUE(tally::schema::succeeded(policy.check_cap(holder, 76, 24)));
  EXPECT_TRUE(tally::schema::succeeded(policy.check_cap(holder, 100, 0)));
}

TEST(supply_cap_policy, rejects_anything_above_the_cap) {
  auto policy = tally::ledger::supply_cap_policy{100};
  auto holder = tally::testing::make_hash(4);
  auto result = policy.check_cap(holder, 76, 76);
  EXPECT_EQ(tally::schema::error_code(result),
            tally::schema::ledger_error_code::capacity_exceeded);
  EXPECT_EQ(result.codespace, "tally.ledger");
  EXPECT_FALSE(tally::schema::succeeded(policy.check_cap(holder, 0, 101)));
  EXPECT_FALSE(tally::schema::succeeded(policy.check_cap(holder, 101, 0)));
}

TEST(supply_cap_policy, overflowing_sum_counts_as_exceeding) {
  constexpr auto kMax = std::numeric_limits<tally::schema::amount_t>::max();
  auto policy = tally::ledger::supply_cap_policy{kMax - 1};
  auto holder = tally::testing::make_hash(4);
  EXPECT_FALSE(
      tally::schema::succeeded(policy.check_cap(holder, kMax - 1, kMax)));
  EXPECT_FALSE(tally::schema::succeeded(policy.check_cap(holder, 2, kMax)));
  EXPECT_TRUE(
      tally::schema::succeeded(policy.check_cap(holder, 1, kMax - 2)));
}
