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
#include <cstddef>
#include <cstdint>

namespace serialtrack {
namespace common {
namespace constants {

// Line settings
constexpr unsigned DEFAULT_BAUD_RATE = 115200;
constexpr unsigned MIN_BAUD_RATE = 50;
constexpr unsigned MAX_BAUD_RATE = 4000000;
constexpr unsigned MIN_CHAR_SIZE = 5;
constexpr unsigned MAX_CHAR_SIZE = 8;

// Engine buffering
constexpr size_t DEFAULT_WRITE_CHUNK = 256;  // bytes handed to one blocking write
constexpr size_t MIN_WRITE_CHUNK = 1;
constexpr size_t MAX_WRITE_CHUNK = 64 * 1024;
constexpr size_t DEFAULT_READ_CHUNK = 4096;  // upper bound for one blocking read
constexpr size_t MIN_READ_CHUNK = 1;
constexpr size_t MAX_READ_CHUNK = 1024 * 1024;

// Device locking
constexpr const char* DEFAULT_LOCK_DIR = "/var/lock";
constexpr const char* LOCK_FILE_PREFIX = "LCK..";
constexpr int LOCK_PID_FIELD_WIDTH = 10;
constexpr int MAX_LOCK_ATTEMPTS = 10;
constexpr size_t MAX_LOCK_FILE_READ = 128;

// Port tracking
constexpr std::chrono::milliseconds DEFAULT_SCAN_INTERVAL{500};
constexpr std::chrono::milliseconds MIN_SCAN_INTERVAL{1};
constexpr std::chrono::milliseconds MAX_SCAN_INTERVAL{3600 * 1000};

// Discovery
constexpr const char* SCAN_OVERRIDE_ENV = "SERIALTRACK_SCAN_OVERRIDE";
constexpr const char* SYSFS_TTY_DIR = "/sys/class/tty";

// Error handling
constexpr size_t MAX_RECENT_ERRORS = 1000;
constexpr size_t MAX_COMPONENT_ERRORS = 100;

}  // namespace constants
}  // namespace common
}  // namespace serialtrack
