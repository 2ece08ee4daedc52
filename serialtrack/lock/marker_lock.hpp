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

#include <memory>
#include <optional>
#include <string>

#include "serialtrack/base/visibility.hpp"
#include "serialtrack/common/constants.hpp"
#include "serialtrack/lock/process_control.hpp"
#include "serialtrack/lock/sharing_mode.hpp"

namespace serialtrack {
namespace lock {

/**
 * @brief UUCP style lock file ("LCK..ttyUSB0") guarding a device across processes
 *
 * The constructor acquires the marker according to the sharing mode and
 * throws PortBusyException when a live foreign process owns it. The
 * destructor releases it. Everything else that can go wrong on the lock
 * directory (missing directory, permission problems) is logged and the
 * marker is skipped.
 *
 * Marker content is the owner pid right-justified in ten columns followed
 * by a newline.
 */
class SERIALTRACK_API MarkerLock {
 public:
  MarkerLock(std::string port, SharingMode mode, std::string lock_dir = common::constants::DEFAULT_LOCK_DIR,
             std::shared_ptr<ProcessControl> process = default_process_control());
  ~MarkerLock();

  MarkerLock(const MarkerLock&) = delete;
  MarkerLock& operator=(const MarkerLock&) = delete;

  /**
   * @brief Delete the marker if this process owns it. Idempotent.
   */
  void release();

  const std::string& path() const { return path_; }
  const std::string& port() const { return port_; }
  SharingMode mode() const { return mode_; }

  /**
   * @brief Marker file path for a device, e.g. /dev/pts/5 -> <lock_dir>/LCK..pts.5
   */
  static std::string marker_path(const std::string& lock_dir, const std::string& port);

  /**
   * @brief Live owner recorded in a marker file
   *
   * Returns nullopt when there is no marker. A marker that cannot be parsed
   * or that names a dead process is deleted and also yields nullopt.
   */
  static std::optional<pid_t> read_owner(const std::string& path, const ProcessControl& process);

 private:
  enum class Attempt { Done, Conflict };

  Attempt try_acquire();

  std::string port_;
  SharingMode mode_;
  std::string lock_dir_;
  std::string path_;
  std::shared_ptr<ProcessControl> process_;
  bool released_{false};
};

}  // namespace lock
}  // namespace serialtrack
