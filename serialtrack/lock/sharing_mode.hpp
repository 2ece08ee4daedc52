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
#include <string_view>

#include "serialtrack/diagnostics/exceptions.hpp"

namespace serialtrack {
namespace lock {

/**
 * @brief How a connection cooperates with other users of the same device
 */
enum class SharingMode {
  Oblivious,  // take no locks and ignore everyone else's
  Polite,     // shared handle lock, refuse devices other processes have locked
  Exclusive,  // exclusive locks, refuse devices other processes have locked
  Stomp,      // exclusive locks, terminate the current owner if there is one
};

inline const char* to_string(SharingMode mode) {
  switch (mode) {
    case SharingMode::Oblivious:
      return "oblivious";
    case SharingMode::Polite:
      return "polite";
    case SharingMode::Exclusive:
      return "exclusive";
    case SharingMode::Stomp:
      return "stomp";
  }
  return "unknown";
}

inline SharingMode parse_sharing_mode(std::string_view name) {
  if (name == "oblivious") return SharingMode::Oblivious;
  if (name == "polite") return SharingMode::Polite;
  if (name == "exclusive") return SharingMode::Exclusive;
  if (name == "stomp") return SharingMode::Stomp;
  throw diagnostics::ConfigurationException("Unknown sharing mode: " + std::string(name), "sharing");
}

}  // namespace lock
}  // namespace serialtrack
