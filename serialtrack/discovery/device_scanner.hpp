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

#include <memory>
#include <string>
#include <vector>

#include "serialtrack/base/visibility.hpp"
#include "serialtrack/common/constants.hpp"
#include "serialtrack/discovery/port_info.hpp"

namespace serialtrack {
namespace discovery {

/**
 * @brief Enumerates the serial ports currently attached to the system
 */
class DeviceScanner {
 public:
  virtual ~DeviceScanner() = default;

  /**
   * @return Ports sorted by natural name order
   * @throws ScanException when the system cannot be enumerated
   */
  virtual std::vector<PortInfo> scan() = 0;
};

/**
 * @brief Linux scanner reading /sys/class/tty
 *
 * Only ttys backed by a device are listed; platform-only UARTs with no
 * hardware behind them are skipped. USB ports carry vid/pid, serial number,
 * manufacturer and product from the parent USB device.
 */
class SERIALTRACK_API SysfsScanner : public DeviceScanner {
 public:
  explicit SysfsScanner(std::string sysfs_dir = common::constants::SYSFS_TTY_DIR, std::string dev_dir = "/dev");

  std::vector<PortInfo> scan() override;

 private:
  std::string sysfs_dir_;
  std::string dev_dir_;
};

/**
 * @brief Scanner returning a fixed listing from a JSON file
 *
 * The file holds {"<port>": {"<attr>": "<value>", ...}, ...}. It is re-read
 * on every scan so tests can change it between scans.
 */
class SERIALTRACK_API JsonFileScanner : public DeviceScanner {
 public:
  explicit JsonFileScanner(std::string path);

  std::vector<PortInfo> scan() override;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

/**
 * @brief JsonFileScanner when $SERIALTRACK_SCAN_OVERRIDE is set, SysfsScanner otherwise
 */
SERIALTRACK_API std::shared_ptr<DeviceScanner> make_default_scanner();

}  // namespace discovery
}  // namespace serialtrack
