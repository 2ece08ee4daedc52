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

#include "serialtrack/lock/process_control.hpp"

#include <signal.h>
#include <unistd.h>

#include <cerrno>

namespace serialtrack {
namespace lock {

pid_t PosixProcessControl::self_pid() const { return ::getpid(); }

bool PosixProcessControl::is_alive(pid_t pid) const {
  if (pid <= 0) return false;
  if (::kill(pid, 0) == 0) return true;
  return errno == EPERM;
}

void PosixProcessControl::terminate(pid_t pid, boost::system::error_code& ec) {
  ec.clear();
  if (::kill(pid, SIGTERM) != 0) {
    ec.assign(errno, boost::system::system_category());
  }
}

std::shared_ptr<ProcessControl> default_process_control() {
  static auto instance = std::make_shared<PosixProcessControl>();
  return instance;
}

}  // namespace lock
}  // namespace serialtrack
