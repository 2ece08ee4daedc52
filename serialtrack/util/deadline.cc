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

#include "serialtrack/util/deadline.hpp"

namespace serialtrack {
namespace util {

Deadline to_deadline(Timeout timeout, Deadline now) {
  if (!timeout) {
    return kUnboundedDeadline;
  }
  if (*timeout <= Clock::duration::zero()) {
    return now;
  }
  if (now >= kUnboundedDeadline || *timeout >= kUnboundedDeadline - now) {
    return kUnboundedDeadline;
  }
  return now + *timeout;
}

Deadline to_deadline(Timeout timeout) { return to_deadline(timeout, Clock::now()); }

Timeout from_deadline(Deadline deadline, Deadline now) {
  if (deadline == kUnboundedDeadline) {
    return std::nullopt;
  }
  if (deadline <= now) {
    return Clock::duration::zero();
  }
  return deadline - now;
}

Timeout from_deadline(Deadline deadline) { return from_deadline(deadline, Clock::now()); }

}  // namespace util
}  // namespace serialtrack
