/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "adt/balance_table.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using rl::adt::AccountId;
using rl::adt::BalanceTable;
using rl::adt::BalanceTableError;
using rl::adt::TokenAmount;

class BalanceTableTest : public ::testing::Test {
 public:
  BalanceTable table;
  AccountId account{123};
};

/**
 * @given empty table
 * @when get balance of unknown account
 * @then zero
 */
TEST_F(BalanceTableTest, MissingIsZero) {
  EXPECT_EQ(table.get(account), 0);
  EXPECT_EQ(table.size(), 0u);
}

/**
 * @given a balance table with record and balance < floor
 * @when subtract is called
 * @then balance is not changed, 0 returned
 */
TEST_F(BalanceTableTest, SubtractWithMinUnderFloor) {
  TokenAmount balance = 10;
  TokenAmount floor = 1000;
  EXPECT_OUTCOME_TRUE_1(table.add(account, balance));
  EXPECT_OUTCOME_EQ(table.subtractWithMin(account, 12, floor), TokenAmount{0});
  EXPECT_EQ(table.get(account), balance);
}

/**
 * @given a balance table with record and balance
 * @when subtract is called with subtrahend more than floor allows
 * @then balance drops to floor, amount subtracted returned
 */
TEST_F(BalanceTableTest, SubtractWithMinFloor) {
  TokenAmount balance = 100;
  TokenAmount floor = 50;
  EXPECT_OUTCOME_TRUE_1(table.add(account, balance));
  EXPECT_OUTCOME_EQ(table.subtractWithMin(account, 90, floor),
                    TokenAmount{balance - floor});
  EXPECT_EQ(table.get(account), floor);
}

/**
 * @given a balance
 * @when subtract more than the balance
 * @then error and balance unchanged
 */
TEST_F(BalanceTableTest, SubtractInsufficient) {
  EXPECT_OUTCOME_TRUE_1(table.add(account, 5));
  EXPECT_OUTCOME_ERROR(BalanceTableError::kInsufficientFunds,
                       table.subtract(account, 6));
  EXPECT_EQ(table.get(account), 5);
}

/**
 * @given two balances
 * @when subtract all of one
 * @then its key is removed
 */
TEST_F(BalanceTableTest, SubtractAllErases) {
  EXPECT_OUTCOME_TRUE_1(table.add(account, 5));
  EXPECT_OUTCOME_TRUE_1(table.add(account + 1, 7));
  EXPECT_OUTCOME_TRUE_1(table.subtract(account, 5));
  EXPECT_EQ(table.size(), 1u);
  EXPECT_EQ(table.total(), 7);
}

/**
 * @given table
 * @when add negative amount
 * @then error
 */
TEST_F(BalanceTableTest, AddNegative) {
  EXPECT_OUTCOME_ERROR(BalanceTableError::kNegativeAmount,
                       table.add(account, -1));
}

/**
 * @given a balance
 * @when subtract negative amount with floor
 * @then error and balance unchanged
 */
TEST_F(BalanceTableTest, SubtractWithMinNegative) {
  EXPECT_OUTCOME_TRUE_1(table.add(account, 5));
  EXPECT_OUTCOME_ERROR(BalanceTableError::kNegativeAmount,
                       table.subtractWithMin(account, -1, 0));
  EXPECT_EQ(table.get(account), 5);
}
