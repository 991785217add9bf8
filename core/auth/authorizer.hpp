/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace rl::auth {
  using primitives::AccountId;

  /**
   * Gates administrative ledger operations
   */
  class Authorizer {
   public:
    virtual ~Authorizer() = default;

    /**
     * @return success if `caller` may run administrative operations,
     * AuthError::kNotAuthorized otherwise
     */
    virtual outcome::result<void> validateCaller(
        const AccountId &caller) const = 0;
  };

  using AuthorizerPtr = std::shared_ptr<Authorizer>;
}  // namespace rl::auth
