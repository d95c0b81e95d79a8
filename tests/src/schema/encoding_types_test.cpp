#include <gtest/gtest.h>
#include <ferry/schema/encoding/scale/encoder.hpp>
#include <ferry/schema/key/builder.hpp>
#include <ferry/schema/key/ledger_keys.hpp>
#include <ferry/schema/relocation_status.hpp>
#include <ferry/testing/common.hpp>

namespace {

using encoder_t =
    ferry::schema::encoding::encoder<ferry::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(encoding_types, relocation_keeps_every_field) {
  auto encoder = encoder_t{};
  auto relocation = ferry::schema::relocation_t{};
  relocation.token = ferry::testing::make_hash(1);
  relocation.account = ferry::testing::make_hash(2);
  relocation.amount = ferry::schema::amount_t{"1000000000000000000000"};
  relocation.status = ferry::schema::relocation_status_t::continued;
  relocation.fee = 3;
  relocation.old_nonce = 4;
  relocation.new_nonce = 9;

  auto decoded = encoder.decode<ferry::schema::relocation_t>(
      ferry::schema::make_bytes_view(encoder.encode(relocation)));
  EXPECT_EQ(decoded.version, 1);
  EXPECT_EQ(decoded.token, relocation.token);
  EXPECT_EQ(decoded.account, relocation.account);
  EXPECT_EQ(decoded.amount, relocation.amount);
  EXPECT_EQ(decoded.status, relocation.status);
  EXPECT_EQ(decoded.fee, relocation.fee);
  EXPECT_EQ(decoded.old_nonce, 4u);
  EXPECT_EQ(decoded.new_nonce, 9u);
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto counters = ferry::schema::chain_counters_t{
      .pending_relocation_count = 2,
      .last_processed_relocation_nonce = 5,
      .last_accommodation_nonce = 7};
  auto bytes = encoder.encode(counters);
  bytes.resize(bytes.size() - 1);
  EXPECT_FALSE(encoder
                   .try_decode<ferry::schema::chain_counters_t>(
                       ferry::schema::make_bytes_view(bytes))
                   .has_value());
}

TEST(encoding_types, event_attributes_survive_encoding) {
  auto encoder = encoder_t{};
  auto event = ferry::schema::event_t{
      .type = "relocate",
      .attributes = {ferry::schema::event_attribute_t{
                         .key = "nonce", .value = "3", .index = false},
                     ferry::schema::event_attribute_t{
                         .key = "chain_id", .value = "1", .index = true}}};
  auto decoded = encoder.decode<ferry::schema::event_t>(
      ferry::schema::make_bytes_view(encoder.encode(event)));
  EXPECT_EQ(decoded.type, "relocate");
  ASSERT_EQ(decoded.attributes.size(), 2u);
  EXPECT_EQ(decoded.attribute("nonce"), "3");
  EXPECT_TRUE(decoded.attributes[1].index);
  EXPECT_FALSE(decoded.attribute("missing").has_value());
}

TEST(encoding_types, relocation_key_parses_back) {
  auto key = ferry::schema::key::make_relocation_key(7, 42);
  auto parsed =
      ferry::schema::key::parse_relocation_key(ferry::schema::make_bytes_view(key));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->first, 7u);
  EXPECT_EQ(parsed->second, 42u);

  EXPECT_FALSE(ferry::schema::key::parse_chain_key(
                   ferry::schema::make_bytes_view(key))
                   .has_value());
}

TEST(encoding_types, guard_config_key_parses_back) {
  auto token = ferry::testing::make_hash(9);
  auto key = ferry::schema::key::make_guard_config_key(3, token);
  auto parsed = ferry::schema::key::parse_guard_config_key(
      ferry::schema::make_bytes_view(key));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->first, 3u);
  EXPECT_EQ(parsed->second, token);
  EXPECT_FALSE(ferry::schema::key::parse_mode_key(
                   ferry::schema::make_bytes_view(key))
                   .has_value());
}

TEST(encoding_types, builder_writes_integers_little_endian) {
  auto key = ferry::schema::key::builder{}.write(uint16_t{0x0102}).data;
  ASSERT_EQ(key.size(), 2u);
  EXPECT_EQ(key[0], 0x02);
  EXPECT_EQ(key[1], 0x01);
}

TEST(encoding_types, relocation_status_strings_round_trip) {
  EXPECT_EQ(ferry::schema::to_string(
                ferry::schema::relocation_status_t::postponed),
            "postponed");
  EXPECT_EQ(ferry::schema::try_from_string<ferry::schema::relocation_status_t>(
                "aborted"),
            ferry::schema::relocation_status_t::aborted);
  EXPECT_FALSE(ferry::schema::is_refusable(
      ferry::schema::relocation_status_t::processed));
  EXPECT_TRUE(ferry::schema::is_refusable(
      ferry::schema::relocation_status_t::postponed));
}
