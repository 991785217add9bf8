/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/ledger_state.hpp"

#include <gtest/gtest.h>

using rl::ledger::AccountId;
using rl::ledger::AccountState;
using rl::ledger::GlobalState;
using rl::ledger::LedgerState;

const AccountId kAccount{13};
const AccountState kStaked{10, 0, 0};

class LedgerStateTest : public ::testing::Test {
 public:
  LedgerState state_;
};

/**
 * @given empty state
 * @when read unknown account
 * @then empty account state
 */
TEST_F(LedgerStateTest, MissingAccount) {
  EXPECT_TRUE(state_.account(kAccount).empty());
  EXPECT_TRUE(state_.accounts().empty());
}

/**
 * @given state without layers
 * @when set account, then set it empty
 * @then account is listed, then removed
 */
TEST_F(LedgerStateTest, SetClear) {
  state_.setAccount(kAccount, kStaked);
  EXPECT_EQ(state_.account(kAccount), kStaked);
  EXPECT_EQ(state_.accounts(), std::vector<AccountId>{kAccount});
  state_.setAccount(kAccount, {});
  EXPECT_TRUE(state_.accounts().empty());
}

/**
 * @given open layer with changes
 * @when revert and end layer
 * @then state is as before the layer
 */
TEST_F(LedgerStateTest, SetRevert) {
  GlobalState global;
  global.total_staked = 10;
  state_.txBegin();
  state_.setAccount(kAccount, kStaked);
  state_.setGlobal(global);
  EXPECT_EQ(state_.global().total_staked, 10);
  state_.txRevert();
  state_.txEnd();
  EXPECT_EQ(state_.txDepth(), 0u);
  EXPECT_EQ(state_.global(), GlobalState{});
  EXPECT_TRUE(state_.account(kAccount).empty());
}

/**
 * @given nested layers
 * @when inner layer ends and outer layer is reverted
 * @then changes of both layers are dropped
 */
TEST_F(LedgerStateTest, NestedRevert) {
  state_.txBegin();
  state_.txBegin();
  state_.setAccount(kAccount, kStaked);
  state_.txEnd();
  EXPECT_EQ(state_.account(kAccount), kStaked);
  state_.txRevert();
  state_.txEnd();
  EXPECT_TRUE(state_.account(kAccount).empty());
}

/**
 * @given nested layers
 * @when both end without revert
 * @then changes are committed, cleared account is removed
 */
TEST_F(LedgerStateTest, NestedCommit) {
  const AccountId other{14};
  state_.setAccount(other, kStaked);
  state_.txBegin();
  state_.setAccount(kAccount, kStaked);
  state_.txBegin();
  state_.setAccount(other, {});
  state_.txEnd();
  state_.txEnd();
  EXPECT_EQ(state_.account(kAccount), kStaked);
  EXPECT_EQ(state_.accounts(), std::vector<AccountId>{kAccount});
}
