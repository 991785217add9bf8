/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <vector>

#include <boost/optional.hpp>

#include "primitives/types.hpp"

namespace rl::ledger {
  using primitives::AccountId;
  using primitives::Timestamp;
  using primitives::TimeDuration;
  using primitives::TokenAmount;

  struct GlobalState {
    TokenAmount total_staked;
    /// cumulative reward per staked unit, scaled by kRewardPrecision
    TokenAmount reward_per_token_stored;
    /// reward units emitted per second while window is active
    TokenAmount reward_rate;
    TimeDuration rewards_duration{};
    Timestamp finish_at{};
    Timestamp last_update_time{};
    TokenAmount total_funded;
    TokenAmount total_claimed;
  };

  inline bool operator==(const GlobalState &lhs, const GlobalState &rhs) {
    return lhs.total_staked == rhs.total_staked
           && lhs.reward_per_token_stored == rhs.reward_per_token_stored
           && lhs.reward_rate == rhs.reward_rate
           && lhs.rewards_duration == rhs.rewards_duration
           && lhs.finish_at == rhs.finish_at
           && lhs.last_update_time == rhs.last_update_time
           && lhs.total_funded == rhs.total_funded
           && lhs.total_claimed == rhs.total_claimed;
  }

  struct AccountState {
    TokenAmount stake;
    /// accumulator value at last settlement of the account
    TokenAmount reward_per_token_paid;
    TokenAmount rewards_owed;

    bool empty() const {
      return stake == 0 && reward_per_token_paid == 0 && rewards_owed == 0;
    }
  };

  inline bool operator==(const AccountState &lhs, const AccountState &rhs) {
    return lhs.stake == rhs.stake
           && lhs.reward_per_token_paid == rhs.reward_per_token_paid
           && lhs.rewards_owed == rhs.rewards_owed;
  }

  /// Ledger state with nested transaction layers
  class LedgerState {
   public:
    /// Layer of changes that are not committed yet
    struct Tx {
      boost::optional<GlobalState> global;
      std::map<AccountId, AccountState> accounts;
    };

    explicit LedgerState(GlobalState global = {});

    const GlobalState &global() const;

    void setGlobal(const GlobalState &global);

    /// Missing accounts read as empty state
    AccountState account(const AccountId &account) const;

    void setAccount(const AccountId &account, const AccountState &state);

    /// Accounts with non-empty state, including uncommitted layers
    std::vector<AccountId> accounts() const;

    /// Creates new layer, writes go to the top layer
    void txBegin();

    /// Drops changes of the top layer
    void txRevert();

    /// Removes top layer and merges changes to the previous layer, or commits
    /// them when it is the last one
    void txEnd();

    size_t txDepth() const;

   private:
    GlobalState global_;
    std::map<AccountId, AccountState> accounts_;
    std::vector<Tx> tx_;
  };
}  // namespace rl::ledger
