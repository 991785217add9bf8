/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace rl::auth {
  enum class AuthError {
    kNotAuthorized = 1,
  };
}  // namespace rl::auth

OUTCOME_HPP_DECLARE_ERROR(rl::auth, AuthError);
