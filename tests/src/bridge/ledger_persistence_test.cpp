#include <gtest/gtest.h>
#include <ferry/testing/ledger_fixture.hpp>

using ferry::schema::error_code_t;
using ferry::schema::fee_refund_mode_t;
using ferry::schema::operation_mode_t;
using ferry::schema::relocation_status_t;
using ferry::testing::kChainId;
using ferry::testing::ledger_fixture;

namespace {

void run_workload(ledger_fixture& fixture) {
  auto& ledger = fixture.ledger();
  fixture.support_token(operation_mode_t::lock_or_transfer,
                        operation_mode_t::lock_or_transfer);
  fixture.fund(ledger_fixture::user(), 100);
  fixture.fund(ledger_fixture::custody(), 50);
  ASSERT_TRUE(ledger
                  .set_fee_collector(ledger_fixture::owner(),
                                     ledger_fixture::collector())
                  .ok());
  for (auto amount = 10; amount <= 30; amount += 10) {
    ASSERT_TRUE(ledger
                    .request_relocation(ledger_fixture::user(), kChainId,
                                        ledger_fixture::token(), amount)
                    .ok());
  }
  ASSERT_TRUE(
      ledger.postpone_relocation(ledger_fixture::bridger(), kChainId, 3).ok());
  ASSERT_TRUE(ledger.relocate(ledger_fixture::bridger(), kChainId, 2).ok());
  ASSERT_TRUE(ledger
                  .accommodate(ledger_fixture::bridger(), kChainId, 1,
                               {ferry::schema::accommodation_t{
                                   .token = ledger_fixture::token(),
                                   .account = ledger_fixture::other_user(),
                                   .amount = 25,
                                   .status = relocation_status_t::processed}})
                  .ok());
}

}  // namespace

TEST(ledger_persistence, state_survives_reconstruction) {
  auto fixture = ledger_fixture{"ferry_ledger_reopen"};
  run_workload(fixture);
  const auto& ledger = fixture.ledger();

  auto reopened = ferry::bridge::ledger{fixture.storage(), fixture.encoder(),
                                        fixture.tokens(), fixture.access(),
                                        ledger_fixture::custody()};

  auto counters = reopened.counters(kChainId);
  EXPECT_EQ(counters.last_processed_relocation_nonce, 2u);
  EXPECT_EQ(counters.pending_relocation_count, 1u);
  EXPECT_EQ(counters.last_accommodation_nonce, 1u);
  EXPECT_EQ(reopened.chains(), std::vector<ferry::schema::chain_id_t>{kChainId});

  EXPECT_EQ(reopened.relocation(kChainId, 1).status,
            relocation_status_t::processed);
  EXPECT_EQ(reopened.relocation(kChainId, 3).status,
            relocation_status_t::postponed);
  EXPECT_EQ(reopened.relocation(kChainId, 3).amount, 30);
  EXPECT_EQ(reopened.relocation(kChainId, 3).account, ledger_fixture::user());

  EXPECT_EQ(reopened.relocation_mode(kChainId, ledger_fixture::token()),
            operation_mode_t::lock_or_transfer);
  EXPECT_EQ(reopened.accommodation_mode(kChainId, ledger_fixture::token()),
            operation_mode_t::lock_or_transfer);
  EXPECT_EQ(reopened.fee_collector(), ledger_fixture::collector());
  EXPECT_EQ(reopened.fee_oracle(), nullptr);
  EXPECT_EQ(reopened.accommodation_guard(), nullptr);

  EXPECT_EQ(reopened.info().height, ledger.info().height);
  EXPECT_EQ(reopened.info().state_root, ledger.info().state_root);
}

TEST(ledger_persistence, reconstructed_ledger_continues_nonces) {
  auto fixture = ledger_fixture{"ferry_ledger_reopen_continue"};
  run_workload(fixture);

  auto reopened = ferry::bridge::ledger{fixture.storage(), fixture.encoder(),
                                        fixture.tokens(), fixture.access(),
                                        ledger_fixture::custody()};
  auto continued =
      reopened.continue_relocation(ledger_fixture::bridger(), kChainId, 3);
  ASSERT_TRUE(continued.ok()) << continued.log;
  EXPECT_EQ(continued.nonce, 4u);
  EXPECT_EQ(reopened
                .accommodate(ledger_fixture::bridger(), kChainId, 1,
                             {ferry::schema::accommodation_t{
                                 .token = ledger_fixture::token(),
                                 .account = ledger_fixture::user(),
                                 .amount = 1,
                                 .status = relocation_status_t::processed}})
                .error(),
            error_code_t::accommodation_nonce_mismatch);
}

TEST(ledger_persistence, only_committed_operations_advance_height) {
  auto fixture = ledger_fixture{"ferry_ledger_height"};
  auto& ledger = fixture.ledger();
  auto genesis = ledger.info();
  EXPECT_EQ(genesis.height, 0u);
  EXPECT_EQ(genesis.state_root, ferry::schema::make_zero_hash());

  fixture.support_token(operation_mode_t::lock_or_transfer,
                        operation_mode_t::lock_or_transfer);
  auto configured = ledger.info();
  EXPECT_EQ(configured.height, 2u);
  EXPECT_NE(configured.state_root, genesis.state_root);

  EXPECT_FALSE(ledger
                   .request_relocation(ledger_fixture::user(), kChainId,
                                       ledger_fixture::token(), 10)
                   .ok());
  EXPECT_EQ(ledger.info().height, configured.height);
  EXPECT_EQ(ledger.info().state_root, configured.state_root);

  fixture.fund(ledger_fixture::user(), 10);
  ASSERT_TRUE(ledger
                  .request_relocation(ledger_fixture::user(), kChainId,
                                      ledger_fixture::token(), 10)
                  .ok());
  EXPECT_EQ(ledger.info().height, 3u);
  EXPECT_NE(ledger.info().state_root, configured.state_root);

  auto reopened = ferry::bridge::ledger{fixture.storage(), fixture.encoder(),
                                        fixture.tokens(), fixture.access(),
                                        ledger_fixture::custody()};
  EXPECT_EQ(reopened.relocation(kChainId, 1).status,
            relocation_status_t::pending);
  EXPECT_EQ(reopened.info().height, 3u);
}

TEST(ledger_persistence, identical_histories_share_state_root) {
  auto first = ledger_fixture{"ferry_ledger_root_first"};
  auto second = ledger_fixture{"ferry_ledger_root_second"};
  run_workload(first);
  run_workload(second);
  EXPECT_EQ(first.ledger().info().state_root,
            second.ledger().info().state_root);

  ASSERT_TRUE(second.ledger()
                  .cancel_relocation(ledger_fixture::user(), kChainId, 3,
                                     fee_refund_mode_t::nothing)
                  .ok());
  EXPECT_NE(first.ledger().info().state_root,
            second.ledger().info().state_root);
}
