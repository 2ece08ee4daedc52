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

#include <string>

#include "serialtrack/base/visibility.hpp"
#include "serialtrack/lock/sharing_mode.hpp"

namespace serialtrack {
namespace lock {

/**
 * @brief Advisory flock(2) plus TIOCEXCL on an open device descriptor
 *
 * Throws PortBusyException from the constructor when another open file
 * description holds a conflicting flock. Other failures are logged only.
 * The descriptor is borrowed and must stay open until release().
 */
class SERIALTRACK_API HandleLock {
 public:
  HandleLock(int fd, std::string port, SharingMode mode);
  ~HandleLock();

  HandleLock(const HandleLock&) = delete;
  HandleLock& operator=(const HandleLock&) = delete;

  /**
   * @brief Clear TIOCEXCL, then drop the flock. Idempotent.
   */
  void release();

  bool holds_flock() const { return flocked_; }
  bool holds_exclusive_access() const { return tiocexcl_; }

 private:
  int fd_;
  std::string port_;
  SharingMode mode_;
  bool flocked_{false};
  bool tiocexcl_{false};
  bool released_{false};
};

}  // namespace lock
}  // namespace serialtrack
