/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace rl::ledger {

  /**
   * @brief Errors returned by RewardLedger operations. Ledger state is left
   * untouched whenever one of them is returned.
   */
  enum class LedgerError {
    /// zero or negative amount
    kInvalidAmount = 1,
    /// withdraw exceeds staked balance
    kInsufficientBalance,
    /// funding too small to give nonzero reward rate
    kZeroRate,
    /// reward asset held by ledger does not cover the window emission
    kInsufficientFunding,
    kWindowActive,
    kNotAuthorized,
    kTransferFailed,
    kInvalidDuration,
    kClockRegression,
  };

}  // namespace rl::ledger

OUTCOME_HPP_DECLARE_ERROR(rl::ledger, LedgerError);
