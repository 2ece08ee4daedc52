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

// Configuration
#include "serialtrack/config/connection_config.hpp"
#include "serialtrack/config/tracker_config.hpp"

// Diagnostics
#include "serialtrack/diagnostics/error_handler.hpp"
#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/diagnostics/logger.hpp"

// Discovery
#include "serialtrack/discovery/device_scanner.hpp"
#include "serialtrack/discovery/glob_matcher.hpp"
#include "serialtrack/discovery/port_info.hpp"

// Connections
#include "serialtrack/connection/serial_connection.hpp"
#include "serialtrack/lock/sharing_mode.hpp"
#include "serialtrack/tracker/port_tracker.hpp"
#include "serialtrack/util/deadline.hpp"

namespace serialtrack {

using config::ConnectionConfig;
using config::TrackerConfig;
using connection::ConnectionContext;
using connection::SerialConnection;
using discovery::GlobMatcher;
using discovery::PortInfo;
using io::Bytes;
using lock::SharingMode;
using tracker::PortTracker;

}  // namespace serialtrack
