/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "primitives/types.hpp"

namespace rl::clock {
  using primitives::Timestamp;

  using UnixTime = std::chrono::seconds;
  using std::chrono::microseconds;

  /// ISO 8601 representation with "Z" suffix, e.g. "2019-10-21T23:12:37Z"
  std::string unixTimeToString(UnixTime);

  inline std::string timestampToString(Timestamp time) {
    return unixTimeToString(UnixTime{time});
  }
}  // namespace rl::clock
