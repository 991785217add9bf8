/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>
#include <utility>

#include "adt/balance_table.hpp"
#include "asset/fungible_asset.hpp"
#include "common/logger.hpp"

namespace rl::asset {
  /**
   * Fungible asset kept in memory: balances plus allowances granted by
   * owners to spenders. Mostly needed to run the ledger without an external
   * token implementation.
   */
  class InMemoryAsset : public FungibleAsset {
   public:
    explicit InMemoryAsset(std::string symbol);

    outcome::result<void> transfer(const AccountId &sender,
                                   const AccountId &to,
                                   const TokenAmount &amount) override;

    outcome::result<void> transferFrom(const AccountId &spender,
                                       const AccountId &from,
                                       const AccountId &to,
                                       const TokenAmount &amount) override;

    outcome::result<TokenAmount> balanceOf(
        const AccountId &account) const override;

    /// Creates `amount` new units on `account`
    outcome::result<void> mint(const AccountId &account,
                               const TokenAmount &amount);

    /// Sets allowance of `spender` over `owner` balance, replacing the old one
    outcome::result<void> approve(const AccountId &owner,
                                  const AccountId &spender,
                                  const TokenAmount &amount);

    TokenAmount allowance(const AccountId &owner,
                          const AccountId &spender) const;

    TokenAmount totalSupply() const;

    const std::string &symbol() const;

   private:
    outcome::result<void> move(const AccountId &from,
                               const AccountId &to,
                               const TokenAmount &amount);

    std::string symbol_;
    adt::BalanceTable balances_;
    std::map<std::pair<AccountId, AccountId>, TokenAmount> allowances_;
    common::Logger logger_;
  };
}  // namespace rl::asset
