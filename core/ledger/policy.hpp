/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/types.hpp"

namespace rl::ledger {
  using primitives::TokenAmount;

  /// Fixed-point scale of the reward-per-token accumulator, 10^18
  inline const TokenAmount kRewardPrecision{"1000000000000000000"};
}  // namespace rl::ledger
