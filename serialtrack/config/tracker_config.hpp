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
#include <string>

#include "serialtrack/common/constants.hpp"
#include "serialtrack/config/connection_config.hpp"

namespace serialtrack {
namespace config {

struct TrackerConfig {
  std::string match;  // port filter, empty matches every port
  std::chrono::milliseconds scan_interval = common::constants::DEFAULT_SCAN_INTERVAL;
  ConnectionConfig connection;

  bool is_valid() const {
    return scan_interval >= common::constants::MIN_SCAN_INTERVAL &&
           scan_interval <= common::constants::MAX_SCAN_INTERVAL && connection.is_valid();
  }

  void validate_and_clamp() {
    if (scan_interval < common::constants::MIN_SCAN_INTERVAL) {
      scan_interval = common::constants::MIN_SCAN_INTERVAL;
    } else if (scan_interval > common::constants::MAX_SCAN_INTERVAL) {
      scan_interval = common::constants::MAX_SCAN_INTERVAL;
    }
    connection.validate_and_clamp();
  }
};

}  // namespace config
}  // namespace serialtrack
