/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/ledger_state.hpp"

#include <cassert>
#include <set>

namespace rl::ledger {
  LedgerState::LedgerState(GlobalState global) : global_{std::move(global)} {}

  const GlobalState &LedgerState::global() const {
    for (auto it{tx_.rbegin()}; it != tx_.rend(); ++it) {
      if (it->global) {
        return *it->global;
      }
    }
    return global_;
  }

  void LedgerState::setGlobal(const GlobalState &global) {
    if (tx_.empty()) {
      global_ = global;
    } else {
      tx_.back().global = global;
    }
  }

  AccountState LedgerState::account(const AccountId &account) const {
    for (auto it{tx_.rbegin()}; it != tx_.rend(); ++it) {
      const auto found{it->accounts.find(account)};
      if (found != it->accounts.end()) {
        return found->second;
      }
    }
    const auto found{accounts_.find(account)};
    if (found != accounts_.end()) {
      return found->second;
    }
    return {};
  }

  void LedgerState::setAccount(const AccountId &account,
                               const AccountState &state) {
    if (!tx_.empty()) {
      tx_.back().accounts[account] = state;
    } else if (state.empty()) {
      accounts_.erase(account);
    } else {
      accounts_[account] = state;
    }
  }

  std::vector<AccountId> LedgerState::accounts() const {
    std::set<AccountId> ids;
    for (const auto &[id, state] : accounts_) {
      ids.insert(id);
    }
    for (const auto &tx : tx_) {
      for (const auto &[id, state] : tx.accounts) {
        ids.insert(id);
      }
    }
    std::vector<AccountId> result;
    for (const auto &id : ids) {
      if (!account(id).empty()) {
        result.push_back(id);
      }
    }
    return result;
  }

  void LedgerState::txBegin() {
    tx_.emplace_back();
  }

  void LedgerState::txRevert() {
    assert(!tx_.empty());
    tx_.back() = {};
  }

  void LedgerState::txEnd() {
    assert(!tx_.empty());
    auto top{std::move(tx_.back())};
    tx_.pop_back();
    if (top.global) {
      setGlobal(*top.global);
    }
    for (auto &[id, state] : top.accounts) {
      setAccount(id, state);
    }
  }

  size_t LedgerState::txDepth() const {
    return tx_.size();
  }
}  // namespace rl::ledger
