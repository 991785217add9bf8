/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "asset/impl/in_memory_asset.hpp"

#include <gtest/gtest.h>

#include "asset/asset_error.hpp"
#include "testutil/outcome.hpp"

using rl::asset::AssetError;
using rl::asset::InMemoryAsset;
using rl::primitives::AccountId;
using rl::primitives::TokenAmount;

class InMemoryAssetTest : public ::testing::Test {
 public:
  void SetUp() override {
    EXPECT_OUTCOME_TRUE_1(asset.mint(alice, 100));
  }

  InMemoryAsset asset{"STK"};
  AccountId alice{1};
  AccountId bob{2};
  AccountId spender{3};
};

/**
 * @given minted balance
 * @when transfer part of it
 * @then balances move, supply is the same
 */
TEST_F(InMemoryAssetTest, Transfer) {
  EXPECT_OUTCOME_TRUE_1(asset.transfer(alice, bob, 30));
  EXPECT_OUTCOME_EQ(asset.balanceOf(alice), TokenAmount{70});
  EXPECT_OUTCOME_EQ(asset.balanceOf(bob), TokenAmount{30});
  EXPECT_EQ(asset.totalSupply(), 100);
  EXPECT_EQ(asset.symbol(), "STK");
}

/**
 * @given minted balance
 * @when transfer more than the balance
 * @then error, nothing moved
 */
TEST_F(InMemoryAssetTest, TransferInsufficient) {
  EXPECT_OUTCOME_ERROR(AssetError::kInsufficientBalance,
                       asset.transfer(alice, bob, 101));
  EXPECT_OUTCOME_EQ(asset.balanceOf(alice), TokenAmount{100});
  EXPECT_OUTCOME_EQ(asset.balanceOf(bob), TokenAmount{0});
}

/**
 * @given asset
 * @when transfer, mint or approve negative amount
 * @then error
 */
TEST_F(InMemoryAssetTest, NegativeAmount) {
  EXPECT_OUTCOME_ERROR(AssetError::kNegativeAmount,
                       asset.transfer(alice, bob, -1));
  EXPECT_OUTCOME_ERROR(AssetError::kNegativeAmount, asset.mint(alice, -1));
  EXPECT_OUTCOME_ERROR(AssetError::kNegativeAmount,
                       asset.approve(alice, spender, -1));
}

/**
 * @given allowance granted to spender
 * @when spender transfers within allowance
 * @then funds move and allowance decreases
 */
TEST_F(InMemoryAssetTest, TransferFrom) {
  EXPECT_OUTCOME_TRUE_1(asset.approve(alice, spender, 50));
  EXPECT_OUTCOME_TRUE_1(asset.transferFrom(spender, alice, bob, 20));
  EXPECT_EQ(asset.allowance(alice, spender), 30);
  EXPECT_OUTCOME_EQ(asset.balanceOf(bob), TokenAmount{20});
}

/**
 * @given allowance smaller than the amount
 * @when spender transfers
 * @then error, balances and allowance unchanged
 */
TEST_F(InMemoryAssetTest, TransferFromInsufficientAllowance) {
  EXPECT_OUTCOME_TRUE_1(asset.approve(alice, spender, 10));
  EXPECT_OUTCOME_ERROR(AssetError::kInsufficientAllowance,
                       asset.transferFrom(spender, alice, bob, 11));
  EXPECT_EQ(asset.allowance(alice, spender), 10);
  EXPECT_OUTCOME_EQ(asset.balanceOf(alice), TokenAmount{100});
}

/**
 * @given allowance larger than the balance
 * @when spender transfers more than the balance
 * @then error, allowance unchanged
 */
TEST_F(InMemoryAssetTest, TransferFromInsufficientBalance) {
  EXPECT_OUTCOME_TRUE_1(asset.approve(alice, spender, 1000));
  EXPECT_OUTCOME_ERROR(AssetError::kInsufficientBalance,
                       asset.transferFrom(spender, alice, bob, 101));
  EXPECT_EQ(asset.allowance(alice, spender), 1000);
}

/**
 * @given allowance
 * @when approve zero
 * @then allowance revoked
 */
TEST_F(InMemoryAssetTest, ApproveReplaces) {
  EXPECT_OUTCOME_TRUE_1(asset.approve(alice, spender, 10));
  EXPECT_OUTCOME_TRUE_1(asset.approve(alice, spender, 0));
  EXPECT_EQ(asset.allowance(alice, spender), 0);
  EXPECT_OUTCOME_FALSE_1(asset.transferFrom(spender, alice, bob, 1));
}
