#include <gtest/gtest.h>
#include <credo/testing/engine_fixture.hpp>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

using credo::schema::amount_t;
using credo::schema::error_code;
using credo::testing::kAlice;
using credo::testing::kBob;
using credo::testing::kMinter;
using credo::testing::kOwner;
using credo::testing::kTreasury;
using credo::testing::make_call;

namespace {

void seed(credo::execution::engine& engine) {
  ASSERT_TRUE(credo::schema::succeeded(engine.create_credential_type(
      make_call(kOwner),
      credo::schema::create_credential_type_t{.name = "alumni"})));
  ASSERT_TRUE(credo::schema::succeeded(engine.add_minter(
      make_call(kOwner), credo::schema::add_minter_t{.account = kMinter})));
}

credo::schema::mint_t mint_alice() {
  return credo::schema::mint_t{.to = kAlice, .credential_type_id = 0};
}

}  // namespace

TEST(engine_lifecycle, state_survives_restart) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_restart"};
  seed(fixture.engine());
  ASSERT_TRUE(credo::schema::succeeded(
      fixture.engine().mint(make_call(kMinter), mint_alice())));
  ASSERT_TRUE(credo::schema::succeeded(fixture.engine().pause(make_call(kOwner))));

  fixture.restart();
  auto& engine = fixture.engine();
  EXPECT_EQ(engine.next_credential_type_id(), 1u);
  EXPECT_TRUE(engine.is_minter(kMinter));
  EXPECT_EQ(engine.balance_of(kAlice, 0), 1);
  EXPECT_TRUE(engine.paused());
  EXPECT_EQ(engine.event_count(), 4u);
}

TEST(engine_lifecycle, persisted_settings_win_over_config) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_settings"};
  ASSERT_TRUE(credo::schema::succeeded(fixture.engine().transfer_ownership(
      make_call(kOwner),
      credo::schema::transfer_ownership_t{.new_owner = kBob})));

  auto changed = credo::testing::make_config(
      credo::schema::authorization_mode_t::trusted_signature,
      credo::schema::recovery_authority_t::minter_with_approval);
  changed.domain_id = credo::testing::make_hash(0xEE);
  fixture.restart(changed);

  auto settings = fixture.engine().settings();
  EXPECT_EQ(settings.owner, kBob);
  EXPECT_EQ(settings.domain_id, credo::testing::kDomain);
  EXPECT_EQ(settings.authorization_mode,
            credo::schema::authorization_mode_t::minter_role);
  EXPECT_EQ(settings.recovery_authority,
            credo::schema::recovery_authority_t::owner);
}

TEST(engine_lifecycle, failed_call_leaves_no_trace) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_failed"};
  auto& engine = fixture.engine();
  seed(engine);
  const auto events_before = engine.event_count();

  auto result = engine.mint(make_call(kAlice, 1'000, amount_t{10}), mint_alice());
  EXPECT_EQ(credo::schema::code_of(result), error_code::caller_not_minter);
  EXPECT_EQ(result.codespace, "credo.execute");
  EXPECT_EQ(result.log, "caller is not a minter");
  EXPECT_TRUE(result.events.empty());
  EXPECT_EQ(engine.event_count(), events_before);
  EXPECT_EQ(engine.forwarded_value(kTreasury), 0);
}

TEST(engine_lifecycle, refused_forward_reverts_the_whole_call) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_refused"};
  auto& engine = fixture.engine();
  seed(engine);
  const auto events_before = engine.event_count();

  auto offered = std::vector<amount_t>{};
  engine.set_value_sink([&offered](const credo::schema::account_id_t& treasury,
                                   const amount_t& value) {
    EXPECT_EQ(treasury, kTreasury);
    offered.push_back(value);
    return false;
  });

  auto result = engine.mint(make_call(kMinter, 1'000, amount_t{25}), mint_alice());
  EXPECT_EQ(credo::schema::code_of(result), error_code::value_forward_failed);
  ASSERT_EQ(offered.size(), 1u);
  EXPECT_EQ(offered[0], 25);
  EXPECT_EQ(engine.balance_of(kAlice, 0), 0);
  EXPECT_EQ(engine.total_supply(0), 0);
  EXPECT_EQ(engine.event_count(), events_before);
  EXPECT_EQ(engine.forwarded_value(kTreasury), 0);
}

TEST(engine_lifecycle, throwing_forward_reverts_the_whole_call) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_throwing"};
  auto& engine = fixture.engine();
  seed(engine);
  const auto events_before = engine.event_count();
  engine.set_value_sink(
      [](const credo::schema::account_id_t&, const amount_t&) -> bool {
        throw std::runtime_error{"treasury offline"};
      });

  auto result = engine.mint(make_call(kMinter, 1'000, amount_t{5}), mint_alice());
  EXPECT_EQ(credo::schema::code_of(result), error_code::value_forward_failed);
  EXPECT_EQ(engine.balance_of(kAlice, 0), 0);
  EXPECT_EQ(engine.total_supply(0), 0);
  EXPECT_EQ(engine.event_count(), events_before);
  EXPECT_EQ(engine.forwarded_value(kTreasury), 0);

  fixture.restart();
  EXPECT_EQ(fixture.engine().balance_of(kAlice, 0), 0);
  EXPECT_EQ(fixture.engine().event_count(), events_before);
}

TEST(engine_lifecycle, sink_is_not_called_without_value) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_no_value"};
  auto& engine = fixture.engine();
  seed(engine);
  auto calls = 0;
  engine.set_value_sink(
      [&calls](const credo::schema::account_id_t&, const amount_t&) {
        ++calls;
        return false;
      });

  EXPECT_TRUE(credo::schema::succeeded(
      engine.mint(make_call(kMinter), mint_alice())));
  EXPECT_EQ(calls, 0);
}

TEST(engine_lifecycle, sink_cannot_reenter_a_mutating_call) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_reentry"};
  auto& engine = fixture.engine();
  seed(engine);

  auto nested = std::optional<credo::schema::operation_result_t>{};
  engine.set_value_sink([&](const credo::schema::account_id_t&,
                            const amount_t&) {
    nested = engine.mint(make_call(kMinter),
                         credo::schema::mint_t{.to = kBob,
                                               .credential_type_id = 0});
    return true;
  });

  auto outer = engine.mint(make_call(kMinter, 1'000, amount_t{5}), mint_alice());
  ASSERT_TRUE(credo::schema::succeeded(outer)) << outer.log;
  ASSERT_TRUE(nested.has_value());
  EXPECT_EQ(credo::schema::code_of(*nested), error_code::reentrant_call);
  EXPECT_EQ(engine.balance_of(kAlice, 0), 1);
  EXPECT_EQ(engine.balance_of(kBob, 0), 0);
  EXPECT_EQ(engine.forwarded_value(kTreasury), 5);
}

TEST(engine_lifecycle, receive_forwards_bare_value) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_receive"};
  auto& engine = fixture.engine();

  auto empty = engine.receive(make_call(kAlice));
  ASSERT_TRUE(credo::schema::succeeded(empty));
  EXPECT_TRUE(empty.events.empty());

  auto paid = engine.receive(make_call(kAlice, 1'000, amount_t{40}));
  ASSERT_TRUE(credo::schema::succeeded(paid));
  ASSERT_EQ(paid.events.size(), 1u);
  EXPECT_EQ(paid.events[0].type, "value_received");
  EXPECT_EQ(engine.forwarded_value(kTreasury), 40);

  ASSERT_TRUE(credo::schema::succeeded(engine.pause(make_call(kOwner))));
  EXPECT_TRUE(credo::schema::succeeded(
      engine.receive(make_call(kBob, 1'000, amount_t{2}))));
  EXPECT_EQ(engine.forwarded_value(kTreasury), 42);
}

TEST(engine_lifecycle, encoded_operations_dispatch_like_direct_calls) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_encoded"};
  auto& engine = fixture.engine();
  auto& encoder = fixture.encoder();

  auto raw = encoder.encode(credo::schema::operation_t{
      credo::schema::create_credential_type_t{.name = "encoded"}});
  auto result = engine.execute_encoded(
      make_call(kOwner), credo::schema::bytes_view_t{raw.data(), raw.size()});
  ASSERT_TRUE(credo::schema::succeeded(result)) << result.log;
  EXPECT_TRUE(engine.is_created(0));

  auto receive = encoder.encode(
      credo::schema::operation_t{credo::schema::receive_value_t{}});
  EXPECT_TRUE(credo::schema::succeeded(engine.execute_encoded(
      make_call(kAlice, 1'000, amount_t{3}),
      credo::schema::bytes_view_t{receive.data(), receive.size()})));
  EXPECT_EQ(engine.forwarded_value(kTreasury), 3);
}

TEST(engine_lifecycle, malformed_operations_are_rejected) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_malformed"};
  auto& engine = fixture.engine();

  EXPECT_EQ(credo::schema::code_of(engine.execute_encoded(
                make_call(kOwner), credo::schema::bytes_view_t{})),
            error_code::invalid_operation);

  auto garbage = credo::schema::bytes_t{0xFE, 0x00};
  auto result = engine.execute_encoded(
      make_call(kOwner),
      credo::schema::bytes_view_t{garbage.data(), garbage.size()});
  EXPECT_EQ(credo::schema::code_of(result), error_code::invalid_operation);
  EXPECT_EQ(credo::schema::kind_of(result),
            credo::schema::error_kind::malformed);

  auto future = credo::schema::add_minter_t{.version = 2, .account = kMinter};
  EXPECT_EQ(credo::schema::code_of(engine.execute(
                make_call(kOwner), credo::schema::operation_t{future})),
            error_code::invalid_operation);
  EXPECT_FALSE(engine.is_minter(kMinter));
}

TEST(engine_lifecycle, events_are_sequenced_across_calls) {
  auto fixture = credo::testing::engine_fixture{"credo_lifecycle_events"};
  auto& engine = fixture.engine();
  seed(engine);
  auto minted = engine.mint(make_call(kMinter), mint_alice());
  ASSERT_TRUE(credo::schema::succeeded(minted));
  ASSERT_EQ(minted.events.size(), 1u);
  EXPECT_EQ(minted.events[0].sequence, 2u);

  auto all = engine.events(0, UINT64_MAX);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].type, "credential_type_created");
  EXPECT_EQ(all[1].type, "minter_added");
  EXPECT_EQ(all[2].type, "credential_issued");
  for (auto i = std::size_t{0}; i < all.size(); ++i) {
    EXPECT_EQ(all[i].sequence, i);
  }

  auto tail = engine.events(1, 1);
  ASSERT_EQ(tail.size(), 1u);
  EXPECT_EQ(tail[0].type, "minter_added");
  EXPECT_TRUE(engine.events(5, 9).empty());
}
