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

#include "serialtrack/common/constants.hpp"
#include "serialtrack/lock/sharing_mode.hpp"

namespace serialtrack {
namespace config {

struct ConnectionConfig {
  unsigned baud_rate = common::constants::DEFAULT_BAUD_RATE;
  unsigned char_size = 8;  // 5,6,7,8
  enum class Parity { None, Even, Odd } parity = Parity::None;
  unsigned stop_bits = 1;  // 1 or 2
  enum class Flow { None, Software, Hardware } flow = Flow::None;

  lock::SharingMode sharing = lock::SharingMode::Exclusive;
  std::string lock_dir = common::constants::DEFAULT_LOCK_DIR;

  size_t write_chunk = common::constants::DEFAULT_WRITE_CHUNK;
  size_t read_chunk = common::constants::DEFAULT_READ_CHUNK;

  bool is_valid() const {
    return baud_rate >= common::constants::MIN_BAUD_RATE && baud_rate <= common::constants::MAX_BAUD_RATE &&
           char_size >= common::constants::MIN_CHAR_SIZE && char_size <= common::constants::MAX_CHAR_SIZE &&
           (stop_bits == 1 || stop_bits == 2) && write_chunk >= common::constants::MIN_WRITE_CHUNK &&
           write_chunk <= common::constants::MAX_WRITE_CHUNK && read_chunk >= common::constants::MIN_READ_CHUNK &&
           read_chunk <= common::constants::MAX_READ_CHUNK;
  }

  // Apply validation and clamp values to valid ranges
  void validate_and_clamp() {
    if (baud_rate < common::constants::MIN_BAUD_RATE) {
      baud_rate = common::constants::MIN_BAUD_RATE;
    } else if (baud_rate > common::constants::MAX_BAUD_RATE) {
      baud_rate = common::constants::MAX_BAUD_RATE;
    }

    if (char_size < common::constants::MIN_CHAR_SIZE)
      char_size = common::constants::MIN_CHAR_SIZE;
    else if (char_size > common::constants::MAX_CHAR_SIZE)
      char_size = common::constants::MAX_CHAR_SIZE;

    if (stop_bits != 1 && stop_bits != 2) stop_bits = 1;

    if (write_chunk < common::constants::MIN_WRITE_CHUNK) {
      write_chunk = common::constants::MIN_WRITE_CHUNK;
    } else if (write_chunk > common::constants::MAX_WRITE_CHUNK) {
      write_chunk = common::constants::MAX_WRITE_CHUNK;
    }

    if (read_chunk < common::constants::MIN_READ_CHUNK) {
      read_chunk = common::constants::MIN_READ_CHUNK;
    } else if (read_chunk > common::constants::MAX_READ_CHUNK) {
      read_chunk = common::constants::MAX_READ_CHUNK;
    }
  }
};

}  // namespace config
}  // namespace serialtrack
