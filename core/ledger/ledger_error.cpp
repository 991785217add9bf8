/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "ledger/ledger_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rl::ledger, LedgerError, e) {
  using rl::ledger::LedgerError;

  switch (e) {
    case (LedgerError::kInvalidAmount):
      return "LedgerError: amount must be positive";
    case (LedgerError::kInsufficientBalance):
      return "LedgerError: amount exceeds staked balance";
    case (LedgerError::kZeroRate):
      return "LedgerError: reward rate is zero";
    case (LedgerError::kInsufficientFunding):
      return "LedgerError: reward amount exceeds reward balance";
    case (LedgerError::kWindowActive):
      return "LedgerError: reward window is still active";
    case (LedgerError::kNotAuthorized):
      return "LedgerError: caller is not authorized";
    case (LedgerError::kTransferFailed):
      return "LedgerError: asset transfer failed";
    case (LedgerError::kInvalidDuration):
      return "LedgerError: rewards duration must be positive";
    case (LedgerError::kClockRegression):
      return "LedgerError: current time is before last settlement";
    default:
      return "LedgerError: unknown error";
  }
}
