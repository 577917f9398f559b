#include <gtest/gtest.h>
#include <credo/testing/engine_fixture.hpp>

#include <vector>

using credo::schema::error_code;
using credo::testing::kAlice;
using credo::testing::kBob;
using credo::testing::kCarol;
using credo::testing::kMinter;
using credo::testing::kOwner;
using credo::testing::make_call;

namespace {

void prepare(credo::execution::engine& engine, const int type_count) {
  for (auto i = 0; i < type_count; ++i) {
    ASSERT_TRUE(credo::schema::succeeded(engine.create_credential_type(
        make_call(kOwner),
        credo::schema::create_credential_type_t{.name = "course"})));
  }
  ASSERT_TRUE(credo::schema::succeeded(engine.add_minter(
      make_call(kOwner), credo::schema::add_minter_t{.account = kMinter})));
}

void issue(credo::execution::engine& engine,
           const credo::schema::account_id_t& to,
           const credo::schema::credential_type_id_t id) {
  auto result = engine.mint(
      make_call(kMinter),
      credo::schema::mint_t{.to = to, .credential_type_id = id});
  ASSERT_TRUE(credo::schema::succeeded(result)) << result.log;
}

credo::schema::recover_t make_recover(
    const credo::schema::account_id_t& old_holder,
    const credo::schema::account_id_t& new_holder) {
  return credo::schema::recover_t{.old_holder = old_holder,
                                  .new_holder = new_holder};
}

}  // namespace

TEST(recovery, moves_only_non_zero_balances) {
  auto fixture = credo::testing::engine_fixture{"credo_recovery_sparse"};
  auto& engine = fixture.engine();
  prepare(engine, 3);
  issue(engine, kAlice, 0);
  issue(engine, kAlice, 2);

  auto result = engine.recover(make_call(kOwner), make_recover(kAlice, kBob));
  ASSERT_TRUE(credo::schema::succeeded(result)) << result.log;

  EXPECT_EQ(engine.balance_of(kBob, 0), 1);
  EXPECT_EQ(engine.balance_of(kBob, 1), 0);
  EXPECT_EQ(engine.balance_of(kBob, 2), 1);
  for (auto id = credo::schema::credential_type_id_t{0}; id < 3; ++id) {
    EXPECT_EQ(engine.balance_of(kAlice, id), 0);
  }
  EXPECT_EQ(engine.total_supply(0), 1);
  EXPECT_EQ(engine.total_supply(2), 1);

  auto moved = fixture.encoder().decode<
      std::vector<credo::schema::credential_type_id_t>>(
      credo::schema::bytes_view_t{result.data.data(), result.data.size()});
  EXPECT_EQ(moved, (std::vector<credo::schema::credential_type_id_t>{0, 2}));

  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, "credentials_recovered");
  EXPECT_EQ(result.events[0].attributes[2].key, "credential_type_ids");
  EXPECT_EQ(result.events[0].attributes[2].value, "0,2");
}

TEST(recovery, empty_holder_fails_without_state_change) {
  auto fixture = credo::testing::engine_fixture{"credo_recovery_empty"};
  auto& engine = fixture.engine();
  prepare(engine, 2);
  const auto events_before = engine.event_count();

  auto result = engine.recover(make_call(kOwner), make_recover(kAlice, kBob));
  EXPECT_EQ(credo::schema::code_of(result), error_code::nothing_to_recover);
  EXPECT_EQ(credo::schema::kind_of(result),
            credo::schema::error_kind::empty_recovery);
  EXPECT_EQ(engine.event_count(), events_before);
  EXPECT_EQ(engine.balance_of(kBob, 0), 0);
}

TEST(recovery, merges_into_existing_balances) {
  auto fixture = credo::testing::engine_fixture{"credo_recovery_merge"};
  auto& engine = fixture.engine();
  prepare(engine, 1);
  issue(engine, kAlice, 0);
  issue(engine, kBob, 0);

  ASSERT_TRUE(credo::schema::succeeded(
      engine.recover(make_call(kOwner), make_recover(kAlice, kBob))));
  EXPECT_EQ(engine.balance_of(kBob, 0), 2);
  EXPECT_EQ(engine.total_supply(0), 2);
}

TEST(recovery, owner_mode_rejects_everyone_else) {
  auto fixture = credo::testing::engine_fixture{"credo_recovery_owner"};
  auto& engine = fixture.engine();
  prepare(engine, 1);
  issue(engine, kAlice, 0);

  EXPECT_EQ(credo::schema::code_of(
                engine.recover(make_call(kMinter), make_recover(kAlice, kBob))),
            error_code::caller_not_recovery_authority);
  EXPECT_EQ(credo::schema::code_of(
                engine.recover(make_call(kAlice), make_recover(kAlice, kBob))),
            error_code::caller_not_recovery_authority);
  EXPECT_EQ(engine.balance_of(kAlice, 0), 1);
}

TEST(recovery, rejects_null_or_identical_holders) {
  auto fixture = credo::testing::engine_fixture{"credo_recovery_identity"};
  auto& engine = fixture.engine();
  prepare(engine, 1);
  issue(engine, kAlice, 0);

  EXPECT_EQ(credo::schema::code_of(engine.recover(
                make_call(kOwner),
                make_recover(kAlice, credo::schema::kNullAccount))),
            error_code::invalid_identity);
  EXPECT_EQ(credo::schema::code_of(engine.recover(
                make_call(kOwner), make_recover(kAlice, kAlice))),
            error_code::invalid_identity);
}

TEST(recovery, is_pause_gated) {
  auto fixture = credo::testing::engine_fixture{"credo_recovery_paused"};
  auto& engine = fixture.engine();
  prepare(engine, 1);
  issue(engine, kAlice, 0);
  ASSERT_TRUE(credo::schema::succeeded(engine.pause(make_call(kOwner))));

  EXPECT_EQ(credo::schema::code_of(
                engine.recover(make_call(kOwner), make_recover(kAlice, kBob))),
            error_code::paused);
}

TEST(recovery, minter_needs_holder_approval_in_approval_mode) {
  auto fixture = credo::testing::engine_fixture{
      "credo_recovery_approval",
      credo::testing::make_config(
          credo::schema::authorization_mode_t::minter_role,
          credo::schema::recovery_authority_t::minter_with_approval)};
  auto& engine = fixture.engine();
  prepare(engine, 2);
  issue(engine, kAlice, 1);

  EXPECT_EQ(credo::schema::code_of(
                engine.recover(make_call(kOwner), make_recover(kAlice, kBob))),
            error_code::caller_not_recovery_authority);
  EXPECT_EQ(credo::schema::code_of(
                engine.recover(make_call(kMinter), make_recover(kAlice, kBob))),
            error_code::holder_approval_missing);

  ASSERT_TRUE(credo::schema::succeeded(engine.set_approval_for_all(
      make_call(kAlice), credo::schema::set_approval_for_all_t{
                             .operator_id = kMinter, .approved = true})));
  auto result =
      engine.recover(make_call(kMinter), make_recover(kAlice, kCarol));
  ASSERT_TRUE(credo::schema::succeeded(result)) << result.log;
  EXPECT_EQ(engine.balance_of(kCarol, 1), 1);
  EXPECT_EQ(engine.balance_of(kAlice, 1), 0);
}
