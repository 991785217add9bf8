/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auth/impl/single_admin_authorizer.hpp"

#include "auth/auth_error.hpp"

namespace rl::auth {
  SingleAdminAuthorizer::SingleAdminAuthorizer(AccountId admin)
      : admin_{admin} {}

  outcome::result<void> SingleAdminAuthorizer::validateCaller(
      const AccountId &caller) const {
    if (caller != admin_) {
      return AuthError::kNotAuthorized;
    }
    return outcome::success();
  }

  AccountId SingleAdminAuthorizer::admin() const {
    return admin_;
  }
}  // namespace rl::auth
