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

#pragma once

#include <chrono>
#include <optional>

#include "serialtrack/base/visibility.hpp"

namespace serialtrack {
namespace util {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

/**
 * @brief Relative wait limit
 *
 * std::nullopt waits forever, zero or negative does not wait at all.
 */
using Timeout = std::optional<Clock::duration>;

/**
 * @brief Sentinel deadline meaning "never expires"
 */
constexpr Deadline kUnboundedDeadline = Deadline::max();

/**
 * @brief Convert a relative timeout to an absolute deadline
 *
 * nullopt maps to kUnboundedDeadline, values <= 0 map to @p now, positive
 * values map to now + timeout, saturating at kUnboundedDeadline.
 */
SERIALTRACK_API Deadline to_deadline(Timeout timeout, Deadline now);
SERIALTRACK_API Deadline to_deadline(Timeout timeout);

/**
 * @brief Convert an absolute deadline back to the time remaining
 *
 * kUnboundedDeadline maps to nullopt, a deadline at or before @p now maps
 * to zero. to_deadline(from_deadline(d, now), now) never exceeds d.
 */
SERIALTRACK_API Timeout from_deadline(Deadline deadline, Deadline now);
SERIALTRACK_API Timeout from_deadline(Deadline deadline);

inline bool is_unbounded(Deadline deadline) { return deadline == kUnboundedDeadline; }

/**
 * @brief Convenience for std::chrono durations of any unit
 */
template <typename Rep, typename Period>
Timeout timeout_of(std::chrono::duration<Rep, Period> d) {
  return std::chrono::duration_cast<Clock::duration>(d);
}

}  // namespace util
}  // namespace serialtrack
