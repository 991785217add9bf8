/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace rl::asset {
  using primitives::AccountId;
  using primitives::TokenAmount;

  /**
   * Fungible asset moved in and out of the ledger. Any call may re-enter the
   * ledger before it returns.
   */
  class FungibleAsset {
   public:
    virtual ~FungibleAsset() = default;

    /**
     * Moves `amount` from `sender` own balance to `to`
     * @param sender - account initiating the transfer
     */
    virtual outcome::result<void> transfer(const AccountId &sender,
                                           const AccountId &to,
                                           const TokenAmount &amount) = 0;

    /**
     * Moves `amount` from `from` to `to` using allowance that `from` granted
     * to `spender`
     */
    virtual outcome::result<void> transferFrom(const AccountId &spender,
                                               const AccountId &from,
                                               const AccountId &to,
                                               const TokenAmount &amount) = 0;

    virtual outcome::result<TokenAmount> balanceOf(
        const AccountId &account) const = 0;
  };

  using FungibleAssetPtr = std::shared_ptr<FungibleAsset>;
}  // namespace rl::asset
