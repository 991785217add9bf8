/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "asset/fungible_asset.hpp"
#include "auth/authorizer.hpp"
#include "clock/utc_clock.hpp"
#include "common/logger.hpp"
#include "ledger/ledger_error.hpp"
#include "ledger/ledger_state.hpp"

namespace rl::ledger {
  using asset::FungibleAsset;
  using asset::FungibleAssetPtr;
  using auth::AuthorizerPtr;

  /**
   * Time-weighted reward distribution. Stakers deposit the staked asset and
   * accrue the reward asset, which is emitted linearly over a window of
   * `rewardsDuration` seconds after each funding, proportionally to stake.
   *
   * Every mutator settles the global accumulator first, then the account it
   * touches, then changes stake, rate or window fields. Outbound transfers
   * are made after all accounting changes of the operation. A failed
   * operation leaves the state as it was, including changes of re-entrant
   * calls made from inside it.
   */
  class RewardLedger {
   public:
    /**
     * @param self - account of the ledger in both assets
     * @param rewards_duration - initial window length, may be changed with
     * setRewardsDuration while no window is active
     */
    RewardLedger(AccountId self,
                 FungibleAssetPtr staking_asset,
                 FungibleAssetPtr rewards_asset,
                 AuthorizerPtr authorizer,
                 std::shared_ptr<clock::UTCClock> clock,
                 TimeDuration rewards_duration = 0);

    /**
     * Deposits `amount` of staked asset. The account must have approved the
     * ledger to spend it.
     */
    outcome::result<void> stake(const AccountId &account,
                                const TokenAmount &amount);

    /// Returns `amount` of staked asset to the account
    outcome::result<void> withdraw(const AccountId &account,
                                   const TokenAmount &amount);

    /// Pays out owed rewards, does nothing when nothing is owed
    outcome::result<void> claim(const AccountId &account);

    /// Withdraws whole stake and claims rewards
    outcome::result<void> exit(const AccountId &account);

    /**
     * Starts new reward window of `rewardsDuration` seconds emitting `amount`
     * plus whatever the active window has not emitted yet. Reward asset must
     * be already transferred to the ledger.
     */
    outcome::result<void> fundRewards(const AccountId &caller,
                                      const TokenAmount &amount);

    outcome::result<void> setRewardsDuration(const AccountId &caller,
                                             TimeDuration duration);

    /// min(now, finishAt)
    Timestamp lastApplicableTime() const;

    /// Accumulator value as if settled now
    TokenAmount rewardPerToken() const;

    /// Rewards owed to the account as if settled now
    TokenAmount earned(const AccountId &account) const;

    /// Emission of a whole window at current rate
    TokenAmount rewardForDuration() const;

    TokenAmount totalStaked() const;
    TokenAmount stakeOf(const AccountId &account) const;
    TokenAmount rewardRate() const;
    TimeDuration rewardsDuration() const;
    Timestamp finishAt() const;
    Timestamp lastUpdateTime() const;
    TokenAmount rewardPerTokenStored() const;
    TokenAmount rewardPerTokenPaid(const AccountId &account) const;
    TokenAmount rewardsOwed(const AccountId &account) const;
    TokenAmount totalFunded() const;
    TokenAmount totalClaimed() const;

    AccountId self() const;
    const LedgerState &state() const;

   private:
    Timestamp now() const;

    /// Folds elapsed time into the accumulator
    outcome::result<void> settleGlobal(Timestamp now);

    /// Folds accumulator growth into the account owed rewards
    void settleAccount(const AccountId &account);

    outcome::result<void> settle(Timestamp now, const AccountId &account);

    outcome::result<void> authorize(const AccountId &caller) const;

    outcome::result<void> pull(FungibleAsset &asset,
                               const AccountId &from,
                               const TokenAmount &amount);

    outcome::result<void> payOut(FungibleAsset &asset,
                                 const AccountId &to,
                                 const TokenAmount &amount);

    /// Runs `op` in a new state layer, reverting the layer if `op` fails
    template <typename Op>
    outcome::result<void> transact(const Op &op);

    AccountId self_;
    FungibleAssetPtr staking_asset_;
    FungibleAssetPtr rewards_asset_;
    AuthorizerPtr authorizer_;
    std::shared_ptr<clock::UTCClock> clock_;
    LedgerState state_;
    common::Logger logger_;
  };
}  // namespace rl::ledger
