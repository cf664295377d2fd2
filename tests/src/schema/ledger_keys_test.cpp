#include <gtest/gtest.h>
#include <tally/schema/key/builder.hpp>
#include <tally/schema/key/ledger_keys.hpp>
#include <tally/testing/common.hpp>

#include <string_view>

namespace {

std::string_view as_text(const tally::schema::bytes_t& bytes) {
  return tally::schema::make_string_view(tally::schema::make_bytes_view(bytes));
}

}  // namespace

TEST(key_builder, writes_integers_little_endian) {
  auto b = tally::schema::key::builder{};
  b.write(std::string_view{"K"});
  b.write(uint16_t{0x0102});
  ASSERT_EQ(b.data.size(), 3u);
  EXPECT_EQ(b.data[0], 'K');
  EXPECT_EQ(b.data[1], 0x02);
  EXPECT_EQ(b.data[2], 0x01);
}

TEST(ledger_keys, keys_share_their_prefix) {
  auto asset = tally::testing::make_hash(7);
  auto holder = tally::testing::make_hash(9);

  auto balance_prefix = tally::schema::key::make_balance_prefix(asset);
  auto balance_key = tally::schema::key::make_balance_key(asset, holder);
  EXPECT_TRUE(as_text(balance_key).starts_with(as_text(balance_prefix)));
  EXPECT_TRUE(as_text(balance_key).starts_with("TALLY|BALANCE|"));
  EXPECT_EQ(balance_key.size(), balance_prefix.size() + holder.size());

  auto whitelist_prefix = tally::schema::key::make_whitelist_prefix(asset);
  auto whitelist_key = tally::schema::key::make_whitelist_key(asset, holder);
  EXPECT_TRUE(as_text(whitelist_key).starts_with(as_text(whitelist_prefix)));
  EXPECT_NE(balance_key, whitelist_key);
}

TEST(ledger_keys, parse_account_suffix_recovers_holder) {
  auto asset = tally::testing::make_hash(3);
  auto holder = tally::testing::make_hash(200);
  auto prefix = tally::schema::key::make_whitelist_prefix(asset);
  auto whitelist_key = tally::schema::key::make_whitelist_key(asset, holder);

  auto parsed = tally::schema::key::parse_account_suffix(
      tally::schema::make_bytes_view(whitelist_key),
      tally::schema::make_bytes_view(prefix));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, holder);

  auto other_prefix = tally::schema::key::make_balance_prefix(asset);
  EXPECT_FALSE(tally::schema::key::parse_account_suffix(
                   tally::schema::make_bytes_view(whitelist_key),
                   tally::schema::make_bytes_view(other_prefix))
                   .has_value());
  EXPECT_FALSE(tally::schema::key::parse_account_suffix(
                   tally::schema::make_bytes_view(prefix),
                   tally::schema::make_bytes_view(prefix))
                   .has_value());
}

TEST(ledger_keys, asset_id_depends_on_admin_and_symbol) {
  auto admin = tally::testing::make_hash(1);
  auto first = tally::schema::key::derive_asset_id(admin, "TALLY");
  EXPECT_EQ(first, tally::schema::key::derive_asset_id(admin, "TALLY"));
  EXPECT_NE(first, tally::schema::key::derive_asset_id(admin, "OTHER"));
  EXPECT_NE(first, tally::schema::key::derive_asset_id(
                       tally::testing::make_hash(2), "TALLY"));
}
