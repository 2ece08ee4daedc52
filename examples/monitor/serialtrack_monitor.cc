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

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

#include "serialtrack/serialtrack.hpp"

using namespace serialtrack;

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int) { g_running = false; }

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cout << "Usage: " << argv[0] << " <match> [baud] [sharing] [log_file]\n"
              << "  e.g. " << argv[0] << " 'vid_pid:0403:6001' 115200 polite\n";
    return 1;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  diagnostics::Logger::instance().set_level(diagnostics::LogLevel::INFO);
  if (argc > 4) {
    diagnostics::Logger::instance().set_file_output(argv[4]);
  }

  TrackerConfig cfg;
  cfg.match = argv[1];
  try {
    if (argc > 2) cfg.connection.baud_rate = static_cast<unsigned>(std::stoul(argv[2]));
    if (argc > 3) cfg.connection.sharing = lock::parse_sharing_mode(argv[3]);
  } catch (const std::exception& e) {
    std::cerr << "Bad argument: " << e.what() << "\n";
    return 1;
  }

  std::shared_ptr<PortTracker> tracker;
  try {
    tracker = PortTracker::create(cfg);
  } catch (const diagnostics::SerialException& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  // Short timeouts so Ctrl-C is noticed promptly
  const auto poll = util::timeout_of(std::chrono::milliseconds(500));
  while (g_running) {
    try {
      auto conn = tracker->connect_sync(poll);
      if (!conn) continue;

      auto data = conn->read_sync(poll);
      if (!data.empty()) {
        std::cout << *conn << " [" << data.size() << "] " << std::string(data.begin(), data.end()) << std::flush;
      }
    } catch (const diagnostics::IoException& e) {
      SERIALTRACK_LOG_WARNING("monitor", "read", std::string("Connection lost: ") + e.what());
    } catch (const diagnostics::ScanException& e) {
      SERIALTRACK_LOG_ERROR("monitor", "scan", e.get_full_message());
      return 2;
    }
  }

  tracker->close();
  diagnostics::Logger::instance().flush();
  std::cout << "\nStopped\n";
  return 0;
}
