#include <gtest/gtest.h>
#include <tally/ledger/staged_state.hpp>
#include <tally/testing/state_fixture.hpp>

#include <cstdint>
#include <string_view>

namespace {

tally::schema::bytes_t key_of(const std::string_view text) {
  return tally::schema::make_bytes(text);
}

}  // namespace

TEST(staged_state, reads_see_staged_writes_before_commit) {
  auto fixture = tally::testing::state_fixture{"tally_staged_reads"};
  auto k = key_of("S|one");

  auto state = fixture.stage();
  state->put(tally::schema::make_bytes_view(k), uint64_t{5});
  EXPECT_EQ(
      state->get<uint64_t>(tally::schema::make_bytes_view(k)).value_or(0),
      5u);
  EXPECT_EQ(state->pending_writes(), 1u);
  EXPECT_FALSE(
      fixture.storage().get_bytes(tally::schema::make_bytes_view(k)));
}

TEST(staged_state, discarded_stage_leaves_storage_unchanged) {
  auto fixture = tally::testing::state_fixture{"tally_staged_discard"};
  auto k = key_of("S|two");
  {
    auto state = fixture.stage();
    state->put(tally::schema::make_bytes_view(k), uint64_t{9});
  }
  auto state = fixture.stage();
  EXPECT_FALSE(state->contains(tally::schema::make_bytes_view(k)));
}

TEST(staged_state, commit_flushes_puts_and_erases) {
  auto fixture = tally::testing::state_fixture{"tally_staged_commit"};
  auto kept = key_of("S|kept");
  auto dropped = key_of("S|dropped");
  {
    auto state = fixture.stage();
    state->put(tally::schema::make_bytes_view(kept), uint64_t{1});
    state->put(tally::schema::make_bytes_view(dropped), uint64_t{2});
    state->commit();
    EXPECT_EQ(state->pending_writes(), 0u);
  }
  {
    auto state = fixture.stage();
    state->erase(tally::schema::make_bytes_view(dropped));
    EXPECT_FALSE(state->contains(tally::schema::make_bytes_view(dropped)));
    state->commit();
  }

  auto state = fixture.stage();
  EXPECT_EQ(
      state->get<uint64_t>(tally::schema::make_bytes_view(kept)).value_or(0),
      1u);
  EXPECT_FALSE(state->contains(tally::schema::make_bytes_view(dropped)));
}

TEST(staged_state, list_by_prefix_merges_staged_and_committed) {
  auto fixture = tally::testing::state_fixture{"tally_staged_list"};
  {
    auto state = fixture.stage();
    state->put(tally::schema::make_bytes_view(key_of("L|a")), true);
    state->put(tally::schema::make_bytes_view(key_of("L|b")), true);
    state->put(tally::schema::make_bytes_view(key_of("M|z")), true);
    state->commit();
  }

  auto state = fixture.stage();
  state->erase(tally::schema::make_bytes_view(key_of("L|a")));
  state->put(tally::schema::make_bytes_view(key_of("L|c")), true);

  auto prefix = key_of("L|");
  auto entries = state->list_by_prefix(tally::schema::make_bytes_view(prefix));
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].first, key_of("L|b"));
  EXPECT_EQ(entries[1].first, key_of("L|c"));
}

TEST(staged_state, unstaged_reads_decode_committed_records) {
  auto fixture = tally::testing::state_fixture{"tally_staged_committed"};
  auto k = key_of("S|committed");
  fixture.storage().write_batch({tally::storage::write_entry{
      .key = k, .value = fixture.encoder().encode(uint64_t{77})}});

  auto state = fixture.stage();
  EXPECT_EQ(state->pending_writes(), 0u);
  EXPECT_EQ(
      state->get<uint64_t>(tally::schema::make_bytes_view(k)).value_or(0),
      77u);

  state->erase(tally::schema::make_bytes_view(k));
  EXPECT_FALSE(state->get<uint64_t>(tally::schema::make_bytes_view(k)));
}
