/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <gtest/gtest.h>

#include <chrono>

#include "serialtrack/util/deadline.hpp"

using namespace serialtrack::util;
using namespace std::chrono_literals;

class DeadlineTest : public ::testing::Test {
 protected:
  // Fixed reference point so results are deterministic
  const Deadline now_ = Deadline(std::chrono::hours(1000));
};

TEST_F(DeadlineTest, NoTimeoutIsUnbounded) {
  EXPECT_EQ(to_deadline(std::nullopt, now_), kUnboundedDeadline);
  EXPECT_FALSE(from_deadline(kUnboundedDeadline, now_).has_value());
  EXPECT_TRUE(is_unbounded(to_deadline(std::nullopt)));
}

TEST_F(DeadlineTest, ZeroOrNegativeTimeoutMeansNow) {
  EXPECT_EQ(to_deadline(Clock::duration::zero(), now_), now_);
  EXPECT_EQ(to_deadline(timeout_of(-5s), now_), now_);
}

TEST_F(DeadlineTest, PositiveTimeoutAddsToNow) {
  EXPECT_EQ(to_deadline(timeout_of(250ms), now_), now_ + 250ms);

  auto remaining = from_deadline(now_ + 250ms, now_);
  ASSERT_TRUE(remaining.has_value());
  EXPECT_EQ(*remaining, std::chrono::duration_cast<Clock::duration>(250ms));
}

TEST_F(DeadlineTest, PastDeadlineLeavesZero) {
  auto remaining = from_deadline(now_ - 1s, now_);
  ASSERT_TRUE(remaining.has_value());
  EXPECT_EQ(*remaining, Clock::duration::zero());

  remaining = from_deadline(now_, now_);
  ASSERT_TRUE(remaining.has_value());
  EXPECT_EQ(*remaining, Clock::duration::zero());
}

TEST_F(DeadlineTest, HugeTimeoutSaturates) {
  // Would overflow time_point arithmetic without clamping
  EXPECT_EQ(to_deadline(Clock::duration::max(), now_), kUnboundedDeadline);
  EXPECT_EQ(to_deadline(Clock::duration::max() - Clock::duration(1), now_), kUnboundedDeadline);
  EXPECT_FALSE(from_deadline(to_deadline(Clock::duration::max(), now_), now_).has_value());
}

TEST_F(DeadlineTest, RoundTripNeverOvershoots) {
  for (auto timeout : {Clock::duration::zero(), Clock::duration(1), Clock::duration(1ms), Clock::duration(3s),
                       Clock::duration(std::chrono::hours(24 * 365))}) {
    Deadline deadline = to_deadline(timeout, now_);
    auto back = from_deadline(deadline, now_);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, timeout);
    EXPECT_LE(to_deadline(back, now_), deadline);
  }
}

TEST_F(DeadlineTest, RoundTripWithAdvancingClock) {
  Deadline deadline = to_deadline(timeout_of(100ms), now_);

  // Later "now" leaves less time and the reconverted deadline stays put
  Deadline later = now_ + 40ms;
  auto remaining = from_deadline(deadline, later);
  ASSERT_TRUE(remaining.has_value());
  EXPECT_EQ(*remaining, std::chrono::duration_cast<Clock::duration>(60ms));
  EXPECT_EQ(to_deadline(remaining, later), deadline);
}

TEST_F(DeadlineTest, RealClockOverloads) {
  Deadline before = Clock::now();
  Deadline deadline = to_deadline(timeout_of(1s));
  EXPECT_GE(deadline, before + 1s);

  auto remaining = from_deadline(deadline);
  ASSERT_TRUE(remaining.has_value());
  EXPECT_LE(*remaining, std::chrono::duration_cast<Clock::duration>(1s));
  EXPECT_GT(*remaining, Clock::duration::zero());
}
