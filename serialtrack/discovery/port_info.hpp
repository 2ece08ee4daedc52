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

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "serialtrack/base/visibility.hpp"

namespace serialtrack {
namespace discovery {

/**
 * @brief A serial port found by a scan, with its descriptive attributes
 *
 * Common attributes: device, name, driver, subsystem, vid, pid, vid_pid,
 * serial_number, manufacturer, product, interface, location, time.
 * The tracker adds tracking=new to ports that appeared since its last scan.
 */
struct PortInfo {
  std::string name;
  std::map<std::string, std::string> attr;

  /**
   * @brief Identity of this particular appearance of the port, "<name>@<time>"
   */
  std::string key() const {
    auto it = attr.find("time");
    return name + "@" + (it != attr.end() ? it->second : std::string());
  }

  bool operator==(const PortInfo& other) const { return name == other.name && attr == other.attr; }
  bool operator!=(const PortInfo& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const PortInfo& port) { return os << port.name; }

/**
 * @brief Natural ordering: digit runs compare by value, so ttyUSB2 < ttyUSB10
 */
SERIALTRACK_API bool natural_less(const std::string& a, const std::string& b);

SERIALTRACK_API void sort_by_name(std::vector<PortInfo>& ports);

}  // namespace discovery
}  // namespace serialtrack
