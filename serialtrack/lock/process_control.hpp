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

#include <sys/types.h>

#include <boost/system/error_code.hpp>
#include <memory>

#include "serialtrack/base/visibility.hpp"

namespace serialtrack {
namespace lock {

/**
 * @brief Process identity, liveness and termination used by the marker lock.
 * Abstracted so tests can simulate foreign owners.
 */
class ProcessControl {
 public:
  virtual ~ProcessControl() = default;

  virtual pid_t self_pid() const = 0;

  // EPERM still means the process exists
  virtual bool is_alive(pid_t pid) const = 0;

  // Ask the process to exit (SIGTERM)
  virtual void terminate(pid_t pid, boost::system::error_code& ec) = 0;
};

class SERIALTRACK_API PosixProcessControl : public ProcessControl {
 public:
  pid_t self_pid() const override;
  bool is_alive(pid_t pid) const override;
  void terminate(pid_t pid, boost::system::error_code& ec) override;
};

SERIALTRACK_API std::shared_ptr<ProcessControl> default_process_control();

}  // namespace lock
}  // namespace serialtrack
