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

#include "serialtrack/common/io_context_manager.hpp"

#include "serialtrack/diagnostics/logger.hpp"

namespace serialtrack {
namespace common {

IoContextManager::IoContextManager() {
  // Logger must outlive this singleton
  diagnostics::Logger::instance();
}

IoContextManager::~IoContextManager() { stop(); }

IoContextManager& IoContextManager::instance() {
  static IoContextManager instance;
  return instance;
}

boost::asio::io_context& IoContextManager::get_context() { return ioc_; }

boost::asio::any_io_executor IoContextManager::get_executor() {
  start();
  return ioc_.get_executor();
}

void IoContextManager::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_.load()) {
    return;
  }

  if (io_thread_.joinable()) {
    if (io_thread_.get_id() == std::this_thread::get_id()) {
      SERIALTRACK_LOG_ERROR("io_context_manager", "start", "Cannot restart IoContextManager from within its own thread.");
      return;
    }
    io_thread_.join();
  }

  if (ioc_.stopped()) {
    ioc_.restart();
  }
  work_guard_ = std::make_unique<WorkGuard>(ioc_.get_executor());

  running_.store(true);
  io_thread_ = std::thread([this]() {
    SERIALTRACK_LOG_DEBUG("io_context_manager", "run", "IoContext thread started.");
    for (;;) {
      try {
        ioc_.run();
        break;
      } catch (const std::exception& e) {
        // A throwing completion handler must not take the shared context down
        SERIALTRACK_LOG_ERROR("io_context_manager", "run", "Handler error: " + std::string(e.what()));
      }
    }
    SERIALTRACK_LOG_DEBUG("io_context_manager", "run", "IoContext thread finished running.");
  });
}

void IoContextManager::stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.load() && !io_thread_.joinable()) {
      return;
    }

    work_guard_.reset();
    ioc_.stop();

    if (io_thread_.joinable()) {
      if (io_thread_.get_id() == std::this_thread::get_id()) {
        SERIALTRACK_LOG_ERROR("io_context_manager", "stop",
                              "Cannot join IoContext thread from within itself. Skipping join.");
        return;
      }
      worker = std::move(io_thread_);
    }
    running_.store(false);
  }

  if (worker.joinable()) {
    worker.join();
  }
}

bool IoContextManager::is_running() const { return running_.load(); }

}  // namespace common
}  // namespace serialtrack
