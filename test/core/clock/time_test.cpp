/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <gtest/gtest.h>

#include "clock/impl/utc_clock_impl.hpp"

using rl::clock::timestampToString;
using rl::clock::UnixTime;
using rl::clock::unixTimeToString;
using rl::clock::UTCClockImpl;

/**
 * @given unix epoch start
 * @when convert to string
 * @then iso string with Z suffix
 */
TEST(Time, EpochStartToString) {
  EXPECT_EQ(unixTimeToString(UnixTime{0}), "1970-01-01T00:00:00Z");
}

/**
 * @given timestamp in seconds
 * @when convert to string
 * @then same as for UnixTime
 */
TEST(Time, TimestampToString) {
  EXPECT_EQ(timestampToString(1571699557), "2019-10-21T23:12:37Z");
  EXPECT_EQ(timestampToString(1571699557),
            unixTimeToString(UnixTime{1571699557}));
}

/**
 * @given system clock
 * @when read time twice
 * @then time does not go back and is after 2019
 */
TEST(Time, UTCClockMonotonic) {
  UTCClockImpl clock;
  const auto first{clock.nowUTC()};
  const auto second{clock.nowUTC()};
  EXPECT_LE(first, second);
  EXPECT_GT(first, UnixTime{1571699557});
}
