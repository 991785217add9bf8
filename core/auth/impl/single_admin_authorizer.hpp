/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "auth/authorizer.hpp"

namespace rl::auth {
  /// Allows exactly one designated administrator
  class SingleAdminAuthorizer : public Authorizer {
   public:
    explicit SingleAdminAuthorizer(AccountId admin);

    outcome::result<void> validateCaller(
        const AccountId &caller) const override;

    AccountId admin() const;

   private:
    AccountId admin_;
  };
}  // namespace rl::auth
