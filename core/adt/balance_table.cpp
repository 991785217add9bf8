/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "adt/balance_table.hpp"

#include <algorithm>

OUTCOME_CPP_DEFINE_CATEGORY(rl::adt, BalanceTableError, e) {
  using E = rl::adt::BalanceTableError;
  switch (e) {
    case E::kInsufficientFunds:
      return "BalanceTableError: insufficient funds";
    case E::kNegativeAmount:
      return "BalanceTableError: negative amount";
  }
  return "BalanceTableError: unknown error";
}

namespace rl::adt {
  TokenAmount BalanceTable::get(const Key &key) const {
    const auto it{balances_.find(key)};
    if (it == balances_.end()) {
      return 0;
    }
    return it->second;
  }

  outcome::result<void> BalanceTable::add(const Key &key,
                                          const TokenAmount &amount) {
    if (amount < 0) {
      return BalanceTableError::kNegativeAmount;
    }
    set(key, get(key) + amount);
    return outcome::success();
  }

  outcome::result<TokenAmount> BalanceTable::subtractWithMin(
      const Key &key, const TokenAmount &amount, const TokenAmount &min) {
    if (amount < 0) {
      return outcome::failure(
          make_error_code(BalanceTableError::kNegativeAmount));
    }
    const auto value{get(key)};
    TokenAmount subtracted =
        std::min(amount, std::max(TokenAmount{value - min}, TokenAmount{0}));
    set(key, value - subtracted);
    return subtracted;
  }

  outcome::result<void> BalanceTable::subtract(const Key &key,
                                               const TokenAmount &amount) {
    if (get(key) < amount) {
      return BalanceTableError::kInsufficientFunds;
    }
    OUTCOME_TRY(subtractWithMin(key, amount, 0));
    return outcome::success();
  }

  TokenAmount BalanceTable::total() const {
    TokenAmount sum;
    for (const auto &[key, value] : balances_) {
      sum += value;
    }
    return sum;
  }

  size_t BalanceTable::size() const {
    return balances_.size();
  }

  void BalanceTable::set(const Key &key, const TokenAmount &value) {
    if (value == 0) {
      balances_.erase(key);
    } else {
      balances_[key] = value;
    }
  }
}  // namespace rl::adt
