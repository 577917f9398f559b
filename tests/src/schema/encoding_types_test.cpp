#include <credo/schema/encoding/scale/encoder.hpp>
#include <credo/schema/engine_settings.hpp>
#include <credo/schema/event.hpp>
#include <credo/schema/operation.hpp>
#include <gtest/gtest.h>
#include <credo/testing/common.hpp>
#include <string>
#include <vector>

namespace {

using encoder_t = credo::schema::encoding::encoder<
    credo::schema::encoding::scale_encoder_tag>;

credo::schema::ed25519_signer_id make_ed25519_signer(const uint8_t seed) {
  auto signer = credo::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

credo::schema::bytes_view_t view_of(const credo::schema::bytes_t& bytes) {
  return credo::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(encoding_types, operation_variant_prefixes_the_alternative_index) {
  auto encoder = encoder_t{};
  auto operation = credo::schema::operation_t{credo::schema::add_minter_t{
      .account = credo::testing::make_account(0x44)}};

  auto encoded = encoder.encode(operation);
  ASSERT_EQ(encoded.size(), 1u + 2u + 32u);
  EXPECT_EQ(encoded[0], 1u);
  EXPECT_EQ(encoded[1], 1u);
  EXPECT_EQ(encoded[2], 0u);
  EXPECT_EQ(encoded[3], 0x44);
}

TEST(encoding_types, mint_with_authorization_round_trips) {
  auto encoder = encoder_t{};
  auto signature = credo::schema::ed25519_signature_t{};
  signature.fill(0x5A);
  auto operation = credo::schema::operation_t{
      credo::schema::mint_with_authorization_t{
          .to = credo::testing::kAlice,
          .credential_type_id = 7,
          .authorization = credo::schema::mint_authorization_t{
              .price = credo::schema::amount_t{"1000000000000000000"},
              .deadline = 1'700'000'000,
              .signature = signature}}};

  auto encoded = encoder.encode(operation);
  auto decoded = encoder.decode<credo::schema::operation_t>(view_of(encoded));
  ASSERT_TRUE(
      std::holds_alternative<credo::schema::mint_with_authorization_t>(decoded));
  const auto& mint =
      std::get<credo::schema::mint_with_authorization_t>(decoded);
  EXPECT_EQ(mint.to, credo::testing::kAlice);
  EXPECT_EQ(mint.credential_type_id, 7u);
  EXPECT_EQ(mint.authorization.price,
            credo::schema::amount_t{"1000000000000000000"});
  EXPECT_EQ(mint.authorization.deadline, 1'700'000'000u);
  ASSERT_TRUE(std::holds_alternative<credo::schema::ed25519_signature_t>(
      mint.authorization.signature));
  EXPECT_EQ(std::get<credo::schema::ed25519_signature_t>(
                mint.authorization.signature),
            signature);
}

TEST(encoding_types, batch_operations_keep_list_order) {
  auto encoder = encoder_t{};
  auto operation = credo::schema::operation_t{
      credo::schema::safe_batch_transfer_from_t{
          .from = credo::testing::kAlice,
          .to = credo::testing::kBob,
          .credential_type_ids = {3, 1, 2},
          .amounts = {1, 0, 5}}};

  auto encoded = encoder.encode(operation);
  auto decoded = encoder.decode<credo::schema::operation_t>(view_of(encoded));
  const auto& batch =
      std::get<credo::schema::safe_batch_transfer_from_t>(decoded);
  EXPECT_EQ(batch.credential_type_ids,
            (std::vector<credo::schema::credential_type_id_t>{3, 1, 2}));
  ASSERT_EQ(batch.amounts.size(), 3u);
  EXPECT_EQ(batch.amounts[2], 5);
}

TEST(encoding_types, engine_settings_round_trip_with_signer) {
  auto encoder = encoder_t{};
  auto settings = credo::schema::engine_settings_t{
      .owner = credo::testing::kOwner,
      .paused = true,
      .trusted_signer = credo::schema::signer_id_t{make_ed25519_signer(9)},
      .treasury = credo::testing::kTreasury,
      .base_uri = "ipfs://credo/",
      .domain_id = credo::testing::kDomain,
      .authorization_mode =
          credo::schema::authorization_mode_t::trusted_signature,
      .recovery_authority =
          credo::schema::recovery_authority_t::minter_with_approval};

  auto encoded = encoder.encode(settings);
  auto decoded =
      encoder.decode<credo::schema::engine_settings_t>(view_of(encoded));
  EXPECT_EQ(decoded.owner, settings.owner);
  EXPECT_TRUE(decoded.paused);
  ASSERT_TRUE(decoded.trusted_signer.has_value());
  EXPECT_TRUE(*decoded.trusted_signer == *settings.trusted_signer);
  EXPECT_EQ(decoded.treasury, settings.treasury);
  EXPECT_EQ(decoded.base_uri, "ipfs://credo/");
  EXPECT_EQ(decoded.domain_id, credo::testing::kDomain);
  EXPECT_EQ(decoded.authorization_mode,
            credo::schema::authorization_mode_t::trusted_signature);
  EXPECT_EQ(decoded.recovery_authority,
            credo::schema::recovery_authority_t::minter_with_approval);
}

TEST(encoding_types, event_round_trips_attributes) {
  auto encoder = encoder_t{};
  auto event = credo::schema::event_t{
      .sequence = 12,
      .type = "credential_issued",
      .attributes = {credo::schema::event_attribute_t{
                         .key = "to", .value = "ab", .index = true},
                     credo::schema::event_attribute_t{
                         .key = "amount", .value = "1", .index = false}}};

  auto decoded = encoder.decode<credo::schema::event_t>(
      view_of(encoder.encode(event)));
  EXPECT_EQ(decoded.sequence, 12u);
  EXPECT_EQ(decoded.type, "credential_issued");
  ASSERT_EQ(decoded.attributes.size(), 2u);
  EXPECT_EQ(decoded.attributes[0].key, "to");
  EXPECT_TRUE(decoded.attributes[0].index);
  EXPECT_FALSE(decoded.attributes[1].index);
}

TEST(encoding_types, try_decode_rejects_truncated_operation) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(credo::schema::operation_t{
      credo::schema::recover_t{.old_holder = credo::testing::kAlice,
                               .new_holder = credo::testing::kBob}});
  encoded.resize(encoded.size() / 2);

  auto decoded = encoder.try_decode<credo::schema::operation_t>(
      view_of(encoded));
  EXPECT_FALSE(decoded.has_value());
}

TEST(encoding_types, try_decode_rejects_unknown_alternative) {
  auto encoder = encoder_t{};
  auto raw = credo::schema::bytes_t{0xFF, 0x01, 0x00};
  auto decoded = encoder.try_decode<credo::schema::operation_t>(view_of(raw));
  EXPECT_FALSE(decoded.has_value());
}
