/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "auth/auth_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rl::auth, AuthError, e) {
  using rl::auth::AuthError;
  if (e == AuthError::kNotAuthorized) {
    return "AuthError: caller is not authorized";
  }
  return "AuthError: unknown error";
}
