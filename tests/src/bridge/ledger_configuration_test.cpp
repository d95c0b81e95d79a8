#include <gtest/gtest.h>
#include <ferry/fee/fixed_rate_fee_oracle.hpp>
#include <ferry/testing/ledger_fixture.hpp>

using ferry::schema::error_code_t;
using ferry::schema::operation_mode_t;
using ferry::testing::kChainId;
using ferry::testing::ledger_fixture;

TEST(ledger_configuration, relocation_mode_is_set_once) {
  auto fixture = ledger_fixture{"ferry_ledger_relocation_mode"};
  auto& ledger = fixture.ledger();
  const auto token = ledger_fixture::token();

  EXPECT_EQ(ledger.relocation_mode(kChainId, token),
            operation_mode_t::unsupported);
  EXPECT_EQ(ledger
                .set_relocation_mode(ledger_fixture::bridger(), kChainId, token,
                                     operation_mode_t::lock_or_transfer)
                .error(),
            error_code_t::missing_role);
  EXPECT_EQ(ledger
                .set_relocation_mode(ledger_fixture::owner(), kChainId, token,
                                     operation_mode_t::unsupported)
                .error(),
            error_code_t::unchanged_relocation_mode);
  EXPECT_EQ(ledger
                .set_relocation_mode(ledger_fixture::owner(), kChainId, token,
                                     operation_mode_t::burn_or_mint)
                .error(),
            error_code_t::non_bridgeable_token);

  auto set = ledger.set_relocation_mode(ledger_fixture::owner(), kChainId,
                                        token,
                                        operation_mode_t::lock_or_transfer);
  ASSERT_TRUE(set.ok()) << set.log;
  ASSERT_EQ(set.events.size(), 1u);
  EXPECT_EQ(set.events[0].type, "set_relocation_mode");
  EXPECT_EQ(set.events[0].attribute("old_mode"), "unsupported");
  EXPECT_EQ(set.events[0].attribute("new_mode"), "lock_or_transfer");
  EXPECT_EQ(ledger.relocation_mode(kChainId, token),
            operation_mode_t::lock_or_transfer);
  EXPECT_EQ(ledger.accommodation_mode(kChainId, token),
            operation_mode_t::unsupported);

  fixture.tokens().set_bridgeable(token, true);
  EXPECT_EQ(ledger
                .set_relocation_mode(ledger_fixture::owner(), kChainId, token,
                                     operation_mode_t::burn_or_mint)
                .error(),
            error_code_t::relocation_mode_is_immutable);
  EXPECT_EQ(ledger.relocation_mode(kChainId + 1, token),
            operation_mode_t::unsupported);
}

TEST(ledger_configuration, accommodation_mode_is_set_once) {
  auto fixture = ledger_fixture{"ferry_ledger_accommodation_mode"};
  auto& ledger = fixture.ledger();
  const auto token = ledger_fixture::token();
  fixture.tokens().set_bridgeable(token, true);

  EXPECT_EQ(ledger
                .set_accommodation_mode(ledger_fixture::owner(), kChainId,
                                        token, operation_mode_t::unsupported)
                .error(),
            error_code_t::unchanged_accommodation_mode);
  ASSERT_TRUE(ledger
                  .set_accommodation_mode(ledger_fixture::owner(), kChainId,
                                          token, operation_mode_t::burn_or_mint)
                  .ok());
  EXPECT_EQ(ledger
                .set_accommodation_mode(ledger_fixture::owner(), kChainId,
                                        token,
                                        operation_mode_t::lock_or_transfer)
                .error(),
            error_code_t::accommodation_mode_is_immutable);
  EXPECT_EQ(ledger.accommodation_mode(kChainId, token),
            operation_mode_t::burn_or_mint);
}

TEST(ledger_configuration, mutable_modes_can_be_withdrawn) {
  auto fixture = ledger_fixture{"ferry_ledger_mutable_modes",
                                ferry::bridge::ledger_options{
                                    .immutable_modes = false}};
  auto& ledger = fixture.ledger();
  const auto token = ledger_fixture::token();
  fixture.support_token(operation_mode_t::lock_or_transfer,
                        operation_mode_t::lock_or_transfer);
  fixture.fund(ledger_fixture::user(), 10);

  ASSERT_TRUE(ledger
                  .set_relocation_mode(ledger_fixture::owner(), kChainId, token,
                                       operation_mode_t::burn_or_mint)
                  .ok());
  ASSERT_TRUE(ledger
                  .request_relocation(ledger_fixture::user(), kChainId, token,
                                      10)
                  .ok());
  ASSERT_TRUE(ledger
                  .set_relocation_mode(ledger_fixture::owner(), kChainId, token,
                                       operation_mode_t::unsupported)
                  .ok());

  auto relocated = ledger.relocate(ledger_fixture::bridger(), kChainId, 1);
  EXPECT_EQ(relocated.error(), error_code_t::unsupported_relocation);
  EXPECT_EQ(relocated.nonce, 1u);
  EXPECT_EQ(ledger.pending_relocation_count(kChainId), 1u);

  auto canceled = ledger.cancel_relocation(
      ledger_fixture::user(), kChainId, 1,
      ferry::schema::fee_refund_mode_t::full);
  ASSERT_TRUE(canceled.ok()) << canceled.log;
  EXPECT_EQ(fixture.balance(ledger_fixture::user()), 10);
}

TEST(ledger_configuration, fees_require_oracle_and_collector) {
  auto fixture = ledger_fixture{"ferry_ledger_fee_config"};
  auto& ledger = fixture.ledger();
  auto oracle =
      ferry::fee::fixed_rate_fee_oracle{ferry::testing::make_hash(70), 100};

  EXPECT_FALSE(ledger.is_fee_taken());
  EXPECT_EQ(ledger.set_fee_oracle(ledger_fixture::owner(), nullptr).error(),
            error_code_t::unchanged_fee_oracle);
  EXPECT_EQ(ledger.set_fee_oracle(ledger_fixture::bridger(), &oracle).error(),
            error_code_t::missing_role);

  auto set_oracle = ledger.set_fee_oracle(ledger_fixture::owner(), &oracle);
  ASSERT_TRUE(set_oracle.ok());
  EXPECT_EQ(set_oracle.events[0].attribute("new_oracle"),
            ferry::schema::to_hex(ferry::testing::make_hash(70)));
  EXPECT_EQ(ledger.fee_oracle(), &oracle);
  EXPECT_FALSE(ledger.is_fee_taken());

  EXPECT_EQ(ledger
                .set_fee_collector(ledger_fixture::owner(),
                                   ferry::schema::make_zero_hash())
                .error(),
            error_code_t::unchanged_fee_collector);
  ASSERT_TRUE(ledger
                  .set_fee_collector(ledger_fixture::owner(),
                                     ledger_fixture::collector())
                  .ok());
  EXPECT_EQ(ledger.fee_collector(), ledger_fixture::collector());
  EXPECT_TRUE(ledger.is_fee_taken());

  ASSERT_TRUE(ledger.set_fee_oracle(ledger_fixture::owner(), nullptr).ok());
  EXPECT_FALSE(ledger.is_fee_taken());
}

TEST(ledger_configuration, accommodation_guard_is_replaceable) {
  auto fixture = ledger_fixture{"ferry_ledger_guard_config"};
  auto& ledger = fixture.ledger();
  auto& guard = fixture.guard();

  EXPECT_EQ(ledger.accommodation_guard(), nullptr);
  EXPECT_EQ(
      ledger.set_accommodation_guard(ledger_fixture::owner(), nullptr).error(),
      error_code_t::unchanged_accommodation_guard);
  EXPECT_EQ(
      ledger.set_accommodation_guard(ledger_fixture::pauser(), &guard).error(),
      error_code_t::missing_role);

  auto installed = ledger.set_accommodation_guard(ledger_fixture::owner(),
                                                  &guard);
  ASSERT_TRUE(installed.ok());
  EXPECT_EQ(installed.events[0].attribute("new_guard_bridge"),
            ferry::schema::to_hex(ledger_fixture::custody()));
  EXPECT_EQ(ledger.accommodation_guard(), &guard);
  EXPECT_EQ(
      ledger.set_accommodation_guard(ledger_fixture::owner(), &guard).error(),
      error_code_t::unchanged_accommodation_guard);

  ASSERT_TRUE(
      ledger.set_accommodation_guard(ledger_fixture::owner(), nullptr).ok());
  EXPECT_EQ(ledger.accommodation_guard(), nullptr);
}

TEST(ledger_configuration, configuration_ignores_pause) {
  auto fixture = ledger_fixture{"ferry_ledger_config_paused"};
  ASSERT_TRUE(fixture.access().pause(ledger_fixture::pauser()).ok());
  EXPECT_TRUE(fixture.ledger()
                  .set_relocation_mode(ledger_fixture::owner(), kChainId,
                                       ledger_fixture::token(),
                                       operation_mode_t::lock_or_transfer)
                  .ok());
  EXPECT_TRUE(fixture.ledger()
                  .set_fee_collector(ledger_fixture::owner(),
                                     ledger_fixture::collector())
                  .ok());
}
