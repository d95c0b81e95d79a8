#include <gtest/gtest.h>
#include <ferry/fee/fixed_rate_fee_oracle.hpp>
#include <ferry/testing/common.hpp>

#include <limits>

namespace {

const auto kOracle = ferry::testing::make_hash(70);
const auto kToken = ferry::testing::make_hash(50);
const auto kAccount = ferry::testing::make_hash(10);
constexpr auto kChainId = ferry::schema::chain_id_t{1};

ferry::schema::amount_t fee_of(const ferry::fee::fixed_rate_fee_oracle& oracle,
                               const ferry::schema::amount_t& amount) {
  return oracle.define_fee(kChainId, kToken, kAccount, amount);
}

}  // namespace

TEST(fixed_rate_fee_oracle, rounds_down_and_applies_minimum) {
  auto oracle = ferry::fee::fixed_rate_fee_oracle{kOracle, 100, 7};
  EXPECT_EQ(fee_of(oracle, 1000), 10);
  EXPECT_EQ(fee_of(oracle, 1099), 10);
  EXPECT_EQ(fee_of(oracle, 100), 7);
  EXPECT_EQ(oracle.id(), kOracle);
}

TEST(fixed_rate_fee_oracle, large_principals_do_not_wrap) {
  auto max = std::numeric_limits<ferry::schema::amount_t>::max();

  auto half = ferry::fee::fixed_rate_fee_oracle{kOracle, 5'000};
  EXPECT_EQ(fee_of(half, max), max / 2);

  auto whole = ferry::fee::fixed_rate_fee_oracle{kOracle, 10'000};
  EXPECT_EQ(fee_of(whole, max), max);

  auto double_rate = ferry::fee::fixed_rate_fee_oracle{kOracle, 20'000};
  EXPECT_EQ(fee_of(double_rate, max), max);
  EXPECT_EQ(fee_of(double_rate, max / 4), max / 4 * 2);
}
