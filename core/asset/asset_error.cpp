/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "asset/asset_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rl::asset, AssetError, e) {
  using rl::asset::AssetError;
  switch (e) {
    case AssetError::kInsufficientBalance:
      return "AssetError: insufficient balance";
    case AssetError::kInsufficientAllowance:
      return "AssetError: insufficient allowance";
    case AssetError::kNegativeAmount:
      return "AssetError: negative amount";
    default:
      return "AssetError: unknown error";
  }
}
