/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace rl::asset {
  enum class AssetError {
    kInsufficientBalance = 1,
    kInsufficientAllowance,
    kNegativeAmount,
  };
}  // namespace rl::asset

OUTCOME_HPP_DECLARE_ERROR(rl::asset, AssetError);
