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

#include <set>
#include <string>
#include <vector>

#include "serialtrack/discovery/port_info.hpp"

namespace serialtrack {
namespace discovery {

/**
 * @brief Predicate selecting the ports of interest
 */
class PortMatcher {
 public:
  virtual ~PortMatcher() = default;

  virtual bool matches(const PortInfo& port) const = 0;

  /**
   * @brief Attribute keys that contributed to a match, for highlighting
   */
  virtual std::set<std::string> matched_keys(const PortInfo& port) const = 0;

  /**
   * @brief The expression this matcher was built from
   */
  virtual std::string str() const = 0;

  std::vector<PortInfo> filter(const std::vector<PortInfo>& ports) const {
    std::vector<PortInfo> out;
    for (const auto& port : ports) {
      if (matches(port)) {
        out.push_back(port);
      }
    }
    return out;
  }
};

}  // namespace discovery
}  // namespace serialtrack
