/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/reward_ledger.hpp"

#include <algorithm>

#include "clock/time.hpp"
#include "ledger/policy.hpp"

namespace rl::ledger {
  namespace {
    TokenAmount rewardPerTokenAt(const GlobalState &global,
                                 Timestamp applicable) {
      if (global.total_staked == 0) {
        return global.reward_per_token_stored;
      }
      return global.reward_per_token_stored
             + TokenAmount{applicable - global.last_update_time}
                   * global.reward_rate * kRewardPrecision
                   / global.total_staked;
    }

    TokenAmount earnedAt(const AccountState &account,
                         const TokenAmount &reward_per_token) {
      return account.rewards_owed
             + account.stake
                   * (reward_per_token - account.reward_per_token_paid)
                   / kRewardPrecision;
    }
  }  // namespace

  RewardLedger::RewardLedger(AccountId self,
                             FungibleAssetPtr staking_asset,
                             FungibleAssetPtr rewards_asset,
                             AuthorizerPtr authorizer,
                             std::shared_ptr<clock::UTCClock> clock,
                             TimeDuration rewards_duration)
      : self_{self},
        staking_asset_{std::move(staking_asset)},
        rewards_asset_{std::move(rewards_asset)},
        authorizer_{std::move(authorizer)},
        clock_{std::move(clock)},
        logger_{common::createLogger("reward_ledger")} {
    GlobalState global;
    global.rewards_duration = rewards_duration;
    state_.setGlobal(global);
  }

  template <typename Op>
  outcome::result<void> RewardLedger::transact(const Op &op) {
    state_.txBegin();
    auto result{op()};
    if (!result) {
      state_.txRevert();
    }
    state_.txEnd();
    return result;
  }

  outcome::result<void> RewardLedger::stake(const AccountId &account,
                                            const TokenAmount &amount) {
    if (amount <= 0) {
      return LedgerError::kInvalidAmount;
    }
    return transact([&]() -> outcome::result<void> {
      OUTCOME_TRY(settle(now(), account));
      auto global{state_.global()};
      auto entry{state_.account(account)};
      entry.stake += amount;
      global.total_staked += amount;
      state_.setAccount(account, entry);
      state_.setGlobal(global);

      OUTCOME_TRY(pull(*staking_asset_, account, amount));
      logger_->debug("{} staked {}, total staked {}",
                     account,
                     amount.str(),
                     global.total_staked.str());
      return outcome::success();
    });
  }

  outcome::result<void> RewardLedger::withdraw(const AccountId &account,
                                               const TokenAmount &amount) {
    if (amount <= 0) {
      return LedgerError::kInvalidAmount;
    }
    if (amount > state_.account(account).stake) {
      return LedgerError::kInsufficientBalance;
    }
    return transact([&]() -> outcome::result<void> {
      OUTCOME_TRY(settle(now(), account));
      auto global{state_.global()};
      auto entry{state_.account(account)};
      entry.stake -= amount;
      global.total_staked -= amount;
      state_.setAccount(account, entry);
      state_.setGlobal(global);

      OUTCOME_TRY(payOut(*staking_asset_, account, amount));
      logger_->debug("{} withdrew {}, total staked {}",
                     account,
                     amount.str(),
                     global.total_staked.str());
      return outcome::success();
    });
  }

  outcome::result<void> RewardLedger::claim(const AccountId &account) {
    return transact([&]() -> outcome::result<void> {
      OUTCOME_TRY(settle(now(), account));
      auto entry{state_.account(account)};
      const auto reward{entry.rewards_owed};
      if (reward <= 0) {
        return outcome::success();
      }
      auto global{state_.global()};
      entry.rewards_owed = 0;
      global.total_claimed += reward;
      state_.setAccount(account, entry);
      state_.setGlobal(global);

      OUTCOME_TRY(payOut(*rewards_asset_, account, reward));
      logger_->debug("{} claimed {}", account, reward.str());
      return outcome::success();
    });
  }

  outcome::result<void> RewardLedger::exit(const AccountId &account) {
    return transact([&]() -> outcome::result<void> {
      OUTCOME_TRY(settle(now(), account));
      auto global{state_.global()};
      auto entry{state_.account(account)};
      const auto amount{entry.stake};
      const auto reward{entry.rewards_owed};
      if (amount <= 0) {
        return LedgerError::kInvalidAmount;
      }
      entry.stake = 0;
      entry.rewards_owed = 0;
      global.total_staked -= amount;
      global.total_claimed += reward;
      state_.setAccount(account, entry);
      state_.setGlobal(global);

      OUTCOME_TRY(payOut(*staking_asset_, account, amount));
      if (reward > 0) {
        OUTCOME_TRY(payOut(*rewards_asset_, account, reward));
      }
      logger_->debug("{} exited with stake {} and reward {}",
                     account,
                     amount.str(),
                     reward.str());
      return outcome::success();
    });
  }

  outcome::result<void> RewardLedger::fundRewards(const AccountId &caller,
                                                  const TokenAmount &amount) {
    OUTCOME_TRY(authorize(caller));
    if (amount < 0) {
      return LedgerError::kInvalidAmount;
    }
    return transact([&]() -> outcome::result<void> {
      const auto now{this->now()};
      OUTCOME_TRY(settleGlobal(now));
      auto global{state_.global()};
      const auto duration{global.rewards_duration};
      if (duration <= 0) {
        return LedgerError::kInvalidDuration;
      }

      TokenAmount rate;
      if (now >= global.finish_at) {
        rate = amount / duration;
      } else {
        const TokenAmount remaining{TokenAmount{global.finish_at - now}
                                    * global.reward_rate};
        rate = (amount + remaining) / duration;
      }
      if (rate == 0) {
        return LedgerError::kZeroRate;
      }

      auto balance{rewards_asset_->balanceOf(self_)};
      if (!balance) {
        logger_->warn("reward balance query failed: {}",
                      balance.error().message());
        return LedgerError::kTransferFailed;
      }
      if (rate * duration > balance.value()) {
        return LedgerError::kInsufficientFunding;
      }

      global.reward_rate = rate;
      global.finish_at = now + duration;
      global.last_update_time = now;
      global.total_funded += amount;
      state_.setGlobal(global);
      logger_->info("funded {}, reward rate {} per second until {}",
                    amount.str(),
                    rate.str(),
                    clock::timestampToString(global.finish_at));
      return outcome::success();
    });
  }

  outcome::result<void> RewardLedger::setRewardsDuration(
      const AccountId &caller, TimeDuration duration) {
    OUTCOME_TRY(authorize(caller));
    auto global{state_.global()};
    if (now() < global.finish_at) {
      return LedgerError::kWindowActive;
    }
    if (duration <= 0) {
      return LedgerError::kInvalidDuration;
    }
    global.rewards_duration = duration;
    state_.setGlobal(global);
    logger_->info("rewards duration set to {} seconds", duration);
    return outcome::success();
  }

  Timestamp RewardLedger::lastApplicableTime() const {
    return std::min(now(), state_.global().finish_at);
  }

  TokenAmount RewardLedger::rewardPerToken() const {
    const auto &global{state_.global()};
    return rewardPerTokenAt(
        global, std::max(lastApplicableTime(), global.last_update_time));
  }

  TokenAmount RewardLedger::earned(const AccountId &account) const {
    return earnedAt(state_.account(account), rewardPerToken());
  }

  TokenAmount RewardLedger::rewardForDuration() const {
    const auto &global{state_.global()};
    return global.reward_rate * global.rewards_duration;
  }

  TokenAmount RewardLedger::totalStaked() const {
    return state_.global().total_staked;
  }

  TokenAmount RewardLedger::stakeOf(const AccountId &account) const {
    return state_.account(account).stake;
  }

  TokenAmount RewardLedger::rewardRate() const {
    return state_.global().reward_rate;
  }

  TimeDuration RewardLedger::rewardsDuration() const {
    return state_.global().rewards_duration;
  }

  Timestamp RewardLedger::finishAt() const {
    return state_.global().finish_at;
  }

  Timestamp RewardLedger::lastUpdateTime() const {
    return state_.global().last_update_time;
  }

  TokenAmount RewardLedger::rewardPerTokenStored() const {
    return state_.global().reward_per_token_stored;
  }

  TokenAmount RewardLedger::rewardPerTokenPaid(const AccountId &account) const {
    return state_.account(account).reward_per_token_paid;
  }

  TokenAmount RewardLedger::rewardsOwed(const AccountId &account) const {
    return state_.account(account).rewards_owed;
  }

  TokenAmount RewardLedger::totalFunded() const {
    return state_.global().total_funded;
  }

  TokenAmount RewardLedger::totalClaimed() const {
    return state_.global().total_claimed;
  }

  AccountId RewardLedger::self() const {
    return self_;
  }

  const LedgerState &RewardLedger::state() const {
    return state_;
  }

  Timestamp RewardLedger::now() const {
    return clock_->nowUTC().count();
  }

  outcome::result<void> RewardLedger::settleGlobal(Timestamp now) {
    auto global{state_.global()};
    const auto applicable{std::min(now, global.finish_at)};
    if (applicable < global.last_update_time) {
      logger_->error("clock at {} is before last settlement at {}",
                     clock::timestampToString(now),
                     clock::timestampToString(global.last_update_time));
      return LedgerError::kClockRegression;
    }
    global.reward_per_token_stored = rewardPerTokenAt(global, applicable);
    global.last_update_time = applicable;
    state_.setGlobal(global);
    return outcome::success();
  }

  void RewardLedger::settleAccount(const AccountId &account) {
    const auto &reward_per_token{state_.global().reward_per_token_stored};
    auto entry{state_.account(account)};
    entry.rewards_owed = earnedAt(entry, reward_per_token);
    entry.reward_per_token_paid = reward_per_token;
    state_.setAccount(account, entry);
  }

  outcome::result<void> RewardLedger::settle(Timestamp now,
                                             const AccountId &account) {
    OUTCOME_TRY(settleGlobal(now));
    settleAccount(account);
    return outcome::success();
  }

  outcome::result<void> RewardLedger::authorize(
      const AccountId &caller) const {
    if (!authorizer_->validateCaller(caller)) {
      logger_->warn("administrative call by {} rejected", caller);
      return LedgerError::kNotAuthorized;
    }
    return outcome::success();
  }

  outcome::result<void> RewardLedger::pull(FungibleAsset &asset,
                                           const AccountId &from,
                                           const TokenAmount &amount) {
    auto result{asset.transferFrom(self_, from, self_, amount)};
    if (!result) {
      logger_->warn("transfer of {} from {} failed: {}",
                    amount.str(),
                    from,
                    result.error().message());
      return LedgerError::kTransferFailed;
    }
    return outcome::success();
  }

  outcome::result<void> RewardLedger::payOut(FungibleAsset &asset,
                                             const AccountId &to,
                                             const TokenAmount &amount) {
    auto result{asset.transfer(self_, to, amount)};
    if (!result) {
      logger_->warn("transfer of {} to {} failed: {}",
                    amount.str(),
                    to,
                    result.error().message());
      return LedgerError::kTransferFailed;
    }
    return outcome::success();
  }
}  // namespace rl::ledger
