#include <gtest/gtest.h>
#include <ferry/testing/common.hpp>
#include <ferry/token/token_book.hpp>
#include <limits>
#include <vector>

namespace {

const auto kToken = ferry::testing::make_hash(50);
const auto kAlice = ferry::testing::make_hash(10);
const auto kBob = ferry::testing::make_hash(11);

}  // namespace

TEST(token_book, transfers_move_balances) {
  auto book = ferry::token::token_book{};
  ASSERT_TRUE(book.credit(kToken, kAlice, 100));

  EXPECT_TRUE(book.transfer_in(kToken, kAlice, kBob, 40));
  EXPECT_EQ(book.balance_of(kToken, kAlice), 60);
  EXPECT_EQ(book.balance_of(kToken, kBob), 40);

  EXPECT_FALSE(book.transfer_out(kToken, kBob, kAlice, 41));
  EXPECT_EQ(book.balance_of(kToken, kBob), 40);
  EXPECT_EQ(book.total_supply(kToken), 100);
}

TEST(token_book, burn_and_mint_require_bridgeable_token) {
  auto book = ferry::token::token_book{};
  ASSERT_TRUE(book.credit(kToken, kAlice, 100));

  EXPECT_FALSE(book.supports_bridge(kToken));
  EXPECT_FALSE(book.burn(kToken, kAlice, 10));
  EXPECT_FALSE(book.mint(kToken, kAlice, 10));

  book.set_bridgeable(kToken, true);
  EXPECT_TRUE(book.supports_bridge(kToken));
  EXPECT_TRUE(book.burn(kToken, kAlice, 30));
  EXPECT_TRUE(book.mint(kToken, kBob, 5));
  EXPECT_EQ(book.balance_of(kToken, kAlice), 70);
  EXPECT_EQ(book.balance_of(kToken, kBob), 5);
  EXPECT_EQ(book.total_supply(kToken), 75);
  EXPECT_FALSE(book.burn(kToken, kBob, 6));
}

TEST(token_book, rollback_restores_balances) {
  auto book = ferry::token::token_book{};
  book.set_bridgeable(kToken, true);
  ASSERT_TRUE(book.credit(kToken, kAlice, 100));

  book.begin();
  EXPECT_TRUE(book.transfer_in(kToken, kAlice, kBob, 25));
  EXPECT_TRUE(book.mint(kToken, kBob, 10));
  book.rollback();

  EXPECT_EQ(book.balance_of(kToken, kAlice), 100);
  EXPECT_EQ(book.balance_of(kToken, kBob), 0);
  EXPECT_EQ(book.total_supply(kToken), 100);
}

TEST(token_book, commit_keeps_balances_and_stages_no_rows) {
  auto book = ferry::token::token_book{};
  ASSERT_TRUE(book.credit(kToken, kAlice, 100));

  auto writes = std::vector<ferry::storage::key_write_t>{};
  book.begin();
  EXPECT_TRUE(book.transfer_out(kToken, kAlice, kBob, 1));
  book.commit(writes);

  EXPECT_TRUE(writes.empty());
  EXPECT_EQ(book.balance_of(kToken, kBob), 1);
}

TEST(token_book, issuance_refuses_supply_overflow) {
  auto book = ferry::token::token_book{};
  book.set_bridgeable(kToken, true);
  auto max = std::numeric_limits<ferry::schema::amount_t>::max();
  ASSERT_TRUE(book.credit(kToken, kAlice, max - 100));

  EXPECT_FALSE(book.credit(kToken, kBob, 101));
  EXPECT_FALSE(book.mint(kToken, kBob, max));
  EXPECT_EQ(book.balance_of(kToken, kBob), 0);
  EXPECT_EQ(book.total_supply(kToken), max - 100);

  EXPECT_TRUE(book.mint(kToken, kBob, 100));
  EXPECT_EQ(book.total_supply(kToken), max);
  EXPECT_FALSE(book.mint(kToken, kBob, 1));
}
