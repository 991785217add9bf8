/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace rl::adt {
  using primitives::AccountId;
  using primitives::TokenAmount;

  enum class BalanceTableError { kInsufficientFunds = 1, kNegativeAmount };

  /**
   * Balances keyed by account. Missing keys read as zero balance and keys
   * whose balance drops to zero are erased.
   */
  class BalanceTable {
   public:
    using Key = AccountId;

    TokenAmount get(const Key &key) const;

    outcome::result<void> add(const Key &key, const TokenAmount &amount);

    /**
     * Subtracts up to `amount`, never leaving less than `min` on the key
     * @return amount actually subtracted
     */
    outcome::result<TokenAmount> subtractWithMin(const Key &key,
                                                 const TokenAmount &amount,
                                                 const TokenAmount &min);

    /// Subtracts exactly `amount` or fails leaving the balance unchanged
    outcome::result<void> subtract(const Key &key, const TokenAmount &amount);

    /// Sum of all balances
    TokenAmount total() const;

    size_t size() const;

   private:
    void set(const Key &key, const TokenAmount &value);

    std::map<Key, TokenAmount> balances_;
  };
}  // namespace rl::adt

OUTCOME_HPP_DECLARE_ERROR(rl::adt, BalanceTableError);
