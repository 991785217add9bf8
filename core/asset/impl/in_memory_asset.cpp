/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "asset/impl/in_memory_asset.hpp"

#include "asset/asset_error.hpp"

namespace rl::asset {
  InMemoryAsset::InMemoryAsset(std::string symbol)
      : symbol_{std::move(symbol)},
        logger_{common::createLogger("asset")} {}

  outcome::result<void> InMemoryAsset::transfer(const AccountId &sender,
                                                const AccountId &to,
                                                const TokenAmount &amount) {
    return move(sender, to, amount);
  }

  outcome::result<void> InMemoryAsset::transferFrom(
      const AccountId &spender,
      const AccountId &from,
      const AccountId &to,
      const TokenAmount &amount) {
    const auto allowed{allowance(from, spender)};
    if (allowed < amount) {
      logger_->debug("{}: allowance of {} over {} is {}, requested {}",
                     symbol_,
                     spender,
                     from,
                     allowed.str(),
                     amount.str());
      return AssetError::kInsufficientAllowance;
    }
    OUTCOME_TRY(move(from, to, amount));
    if (amount != 0) {
      allowances_[{from, spender}] = allowed - amount;
    }
    return outcome::success();
  }

  outcome::result<TokenAmount> InMemoryAsset::balanceOf(
      const AccountId &account) const {
    return balances_.get(account);
  }

  outcome::result<void> InMemoryAsset::mint(const AccountId &account,
                                            const TokenAmount &amount) {
    if (amount < 0) {
      return AssetError::kNegativeAmount;
    }
    OUTCOME_TRY(balances_.add(account, amount));
    return outcome::success();
  }

  outcome::result<void> InMemoryAsset::approve(const AccountId &owner,
                                               const AccountId &spender,
                                               const TokenAmount &amount) {
    if (amount < 0) {
      return AssetError::kNegativeAmount;
    }
    if (amount == 0) {
      allowances_.erase({owner, spender});
    } else {
      allowances_[{owner, spender}] = amount;
    }
    return outcome::success();
  }

  TokenAmount InMemoryAsset::allowance(const AccountId &owner,
                                       const AccountId &spender) const {
    const auto it{allowances_.find({owner, spender})};
    if (it == allowances_.end()) {
      return 0;
    }
    return it->second;
  }

  TokenAmount InMemoryAsset::totalSupply() const {
    return balances_.total();
  }

  const std::string &InMemoryAsset::symbol() const {
    return symbol_;
  }

  outcome::result<void> InMemoryAsset::move(const AccountId &from,
                                            const AccountId &to,
                                            const TokenAmount &amount) {
    if (amount < 0) {
      return AssetError::kNegativeAmount;
    }
    if (balances_.get(from) < amount) {
      return AssetError::kInsufficientBalance;
    }
    OUTCOME_TRY(balances_.subtract(from, amount));
    OUTCOME_TRY(balances_.add(to, amount));
    return outcome::success();
  }
}  // namespace rl::asset
