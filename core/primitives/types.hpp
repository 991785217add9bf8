/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "primitives/big_int.hpp"

namespace rl::primitives {
  /// Identity of a ledger participant or of the ledger custodian itself
  using AccountId = uint64_t;

  using TokenAmount = BigInt;

  /**
   * @brief seconds since unix epoch, the time as seen by the ledger
   */
  using Timestamp = int64_t;

  using TimeDuration = int64_t;
}  // namespace rl::primitives
