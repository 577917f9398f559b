#include <credo/crypto/verify.hpp>
#include <gtest/gtest.h>
#include <credo/testing/ed25519_keypair.hpp>
#include <credo/testing/engine_fixture.hpp>

#include <optional>
#include <stdexcept>

using credo::schema::amount_t;
using credo::schema::error_code;
using credo::testing::kAlice;
using credo::testing::kBob;
using credo::testing::kOwner;
using credo::testing::kTreasury;
using credo::testing::make_call;

namespace {

constexpr auto kNow = credo::schema::timestamp_seconds_t{5'000};
constexpr auto kDeadline = credo::schema::timestamp_seconds_t{6'000};

credo::execution::engine_config_t make_signed_config(
    const credo::testing::ed25519_keypair& keypair) {
  auto config = credo::testing::make_config(
      credo::schema::authorization_mode_t::trusted_signature);
  config.trusted_signer = keypair.signer();
  return config;
}

class signature_mint : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!credo::crypto::available()) {
      GTEST_SKIP() << "OpenSSL backend does not expose required crypto "
                      "providers";
    }
    fixture_.emplace("credo_signature_mint", make_signed_config(signer_));
    auto created = engine().create_credential_type(
        make_call(kOwner),
        credo::schema::create_credential_type_t{
            .name = "ticket", .mint_start = 0, .mint_end = 0, .price = 100});
    ASSERT_TRUE(credo::schema::succeeded(created)) << created.log;
  }

  credo::execution::engine& engine() { return fixture_->engine(); }

  credo::schema::mint_with_authorization_t make_grant(
      const credo::testing::ed25519_keypair& keypair,
      const credo::schema::account_id_t& to,
      const amount_t& price = 100,
      const credo::schema::timestamp_seconds_t deadline = kDeadline) {
    auto digest = engine().mint_authorization_digest(to, 0, price, deadline);
    return credo::schema::mint_with_authorization_t{
        .to = to,
        .credential_type_id = 0,
        .authorization = credo::schema::mint_authorization_t{
            .price = price,
            .deadline = deadline,
            .signature = keypair.sign(digest)}};
  }

  credo::schema::operation_result_t submit(
      const credo::schema::mint_with_authorization_t& grant,
      const amount_t& value = 100,
      const credo::schema::timestamp_seconds_t now = kNow) {
    return engine().mint_with_authorization(make_call(kBob, now, value), grant);
  }

  credo::testing::ed25519_keypair signer_;
  std::optional<credo::testing::engine_fixture> fixture_;
};

}  // namespace

TEST_F(signature_mint, valid_grant_mints_and_consumes_nonce) {
  auto result = submit(make_grant(signer_, kAlice));
  ASSERT_TRUE(credo::schema::succeeded(result)) << result.log;
  EXPECT_EQ(engine().balance_of(kAlice, 0), 1);
  EXPECT_EQ(engine().nonce_of(kAlice), 1u);
  EXPECT_EQ(engine().nonce_of(kBob), 0u);
  EXPECT_EQ(engine().forwarded_value(kTreasury), 100);
}

TEST_F(signature_mint, replayed_grant_is_rejected) {
  auto grant = make_grant(signer_, kAlice);
  ASSERT_TRUE(credo::schema::succeeded(submit(grant)));
  ASSERT_TRUE(credo::schema::succeeded(engine().burn(
      make_call(kAlice),
      credo::schema::burn_t{
          .holder = kAlice, .credential_type_id = 0, .amount = 1})));

  auto replay = submit(grant);
  EXPECT_EQ(credo::schema::code_of(replay), error_code::invalid_signature);
  EXPECT_EQ(engine().balance_of(kAlice, 0), 0);
  EXPECT_EQ(engine().nonce_of(kAlice), 1u);
}

TEST_F(signature_mint, holder_with_balance_cannot_claim_again) {
  ASSERT_TRUE(credo::schema::succeeded(submit(make_grant(signer_, kAlice))));
  auto second = submit(make_grant(signer_, kAlice));
  EXPECT_EQ(credo::schema::code_of(second), error_code::credential_already_held);
  EXPECT_EQ(engine().nonce_of(kAlice), 1u);
}

TEST_F(signature_mint, failed_attempts_leave_nonce_untouched) {
  auto impostor = credo::testing::ed25519_keypair{};
  EXPECT_EQ(credo::schema::code_of(submit(make_grant(impostor, kAlice))),
            error_code::invalid_signature);
  EXPECT_EQ(credo::schema::code_of(submit(make_grant(signer_, kAlice), 99)),
            error_code::insufficient_value);
  EXPECT_EQ(engine().nonce_of(kAlice), 0u);

  ASSERT_TRUE(credo::schema::succeeded(submit(make_grant(signer_, kAlice))));
  EXPECT_EQ(engine().nonce_of(kAlice), 1u);
}

TEST_F(signature_mint, nonce_counts_only_successful_mints) {
  for (auto round = 0; round < 3; ++round) {
    EXPECT_EQ(credo::schema::code_of(submit(make_grant(signer_, kAlice), 1)),
              error_code::insufficient_value);
    ASSERT_TRUE(credo::schema::succeeded(submit(make_grant(signer_, kAlice))));
    ASSERT_TRUE(credo::schema::succeeded(engine().burn(
        make_call(kAlice),
        credo::schema::burn_t{
            .holder = kAlice, .credential_type_id = 0, .amount = 1})));
  }
  EXPECT_EQ(engine().nonce_of(kAlice), 3u);
}

TEST_F(signature_mint, expiry_is_distinct_from_forgery) {
  auto grant = make_grant(signer_, kAlice, 100, kNow - 1);
  auto expired = submit(grant);
  EXPECT_EQ(credo::schema::code_of(expired), error_code::signature_expired);
  EXPECT_EQ(credo::schema::kind_of(expired),
            credo::schema::error_kind::authorization);

  auto at_deadline = make_grant(signer_, kAlice, 100, kNow);
  EXPECT_TRUE(credo::schema::succeeded(submit(at_deadline)));
}

TEST_F(signature_mint, grant_is_bound_to_its_recipient) {
  auto grant = make_grant(signer_, kAlice);
  grant.to = kBob;
  EXPECT_EQ(credo::schema::code_of(submit(grant)),
            error_code::invalid_signature);
}

TEST_F(signature_mint, tampered_price_breaks_the_signature) {
  auto grant = make_grant(signer_, kAlice, 150);
  grant.authorization.price = 100;
  EXPECT_EQ(credo::schema::code_of(submit(grant, 150)),
            error_code::invalid_signature);
}

TEST_F(signature_mint, signed_price_must_cover_registered_price) {
  auto cheap = submit(make_grant(signer_, kAlice, 50), 50);
  EXPECT_EQ(credo::schema::code_of(cheap),
            error_code::authorization_price_below_registered);
  EXPECT_EQ(credo::schema::kind_of(cheap), credo::schema::error_kind::value);

  EXPECT_EQ(credo::schema::code_of(submit(make_grant(signer_, kAlice, 150), 120)),
            error_code::insufficient_value);
  EXPECT_TRUE(credo::schema::succeeded(
      submit(make_grant(signer_, kAlice, 150), 200)));
  EXPECT_EQ(engine().forwarded_value(kTreasury), 200);
}

TEST_F(signature_mint, rotation_invalidates_unconsumed_grants) {
  auto pending = make_grant(signer_, kAlice);
  auto successor = credo::testing::ed25519_keypair{};
  ASSERT_TRUE(credo::schema::succeeded(engine().set_signer(
      make_call(kOwner),
      credo::schema::set_signer_t{.signer = successor.signer()})));

  EXPECT_EQ(credo::schema::code_of(submit(pending)),
            error_code::invalid_signature);
  EXPECT_TRUE(credo::schema::succeeded(submit(make_grant(successor, kAlice))));
}

TEST_F(signature_mint, cleared_signer_disables_the_path) {
  auto grant = make_grant(signer_, kAlice);
  ASSERT_TRUE(credo::schema::succeeded(
      engine().set_signer(make_call(kOwner), credo::schema::set_signer_t{})));
  EXPECT_EQ(credo::schema::code_of(submit(grant)),
            error_code::signer_not_configured);
}

TEST_F(signature_mint, role_path_is_rejected_in_signature_mode) {
  ASSERT_TRUE(credo::schema::succeeded(engine().add_minter(
      make_call(kOwner),
      credo::schema::add_minter_t{.account = credo::testing::kMinter})));
  auto result = engine().mint(
      make_call(credo::testing::kMinter, kNow),
      credo::schema::mint_t{.to = kAlice, .credential_type_id = 0});
  EXPECT_EQ(credo::schema::code_of(result),
            error_code::authorization_mode_mismatch);
}

TEST_F(signature_mint, grant_does_not_cross_deployments) {
  auto grant = make_grant(signer_, kAlice);

  auto other_config = make_signed_config(signer_);
  other_config.domain_id = credo::testing::make_hash(0xD7);
  auto other = credo::testing::engine_fixture{"credo_signature_other_domain",
                                              other_config};
  ASSERT_TRUE(credo::schema::succeeded(other.engine().create_credential_type(
      make_call(kOwner),
      credo::schema::create_credential_type_t{.name = "ticket", .price = 100})));

  EXPECT_EQ(credo::schema::code_of(other.engine().mint_with_authorization(
                make_call(kBob, kNow, 100), grant)),
            error_code::invalid_signature);
}

TEST_F(signature_mint, throwing_treasury_keeps_grant_usable) {
  const auto events_before = engine().event_count();
  engine().set_value_sink(
      [](const credo::schema::account_id_t&, const amount_t&) -> bool {
        throw std::runtime_error{"treasury offline"};
      });

  auto grant = make_grant(signer_, kAlice);
  auto failed = submit(grant);
  EXPECT_EQ(credo::schema::code_of(failed), error_code::value_forward_failed);
  EXPECT_EQ(failed.info, "treasury sink failed: treasury offline");
  EXPECT_EQ(engine().nonce_of(kAlice), 0u);
  EXPECT_EQ(engine().balance_of(kAlice, 0), 0);
  EXPECT_EQ(engine().total_supply(0), 0);
  EXPECT_EQ(engine().event_count(), events_before);
  EXPECT_EQ(engine().forwarded_value(kTreasury), 0);

  engine().set_value_sink(
      [](const credo::schema::account_id_t&, const amount_t&) { return true; });
  auto retried = submit(grant);
  ASSERT_TRUE(credo::schema::succeeded(retried)) << retried.log;
  EXPECT_EQ(engine().nonce_of(kAlice), 1u);
}

TEST_F(signature_mint, null_recipient_is_checked_after_the_signature) {
  auto impostor = credo::testing::ed25519_keypair{};
  EXPECT_EQ(credo::schema::code_of(
                submit(make_grant(impostor, credo::schema::kNullAccount))),
            error_code::invalid_signature);
  EXPECT_EQ(credo::schema::code_of(
                submit(make_grant(signer_, credo::schema::kNullAccount))),
            error_code::invalid_identity);
}
