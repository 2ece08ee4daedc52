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

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <mutex>
#include <thread>

#include "serialtrack/base/visibility.hpp"

namespace serialtrack {
namespace common {

/**
 * Process-wide io_context running on one background thread.
 * Connections and trackers that are not given an executor complete their
 * asynchronous operations here. Being single-threaded, it also serializes
 * the waker bookkeeping of those operations.
 */
class SERIALTRACK_API IoContextManager {
 public:
  using IoContext = boost::asio::io_context;
  using WorkGuard = boost::asio::executor_work_guard<IoContext::executor_type>;

  static IoContextManager& instance();

  IoContextManager();
  ~IoContextManager();

  IoContext& get_context();

  // Starts the background thread on first use
  boost::asio::any_io_executor get_executor();

  void start();
  void stop();
  bool is_running() const;

 private:
  IoContextManager(const IoContextManager&) = delete;
  IoContextManager& operator=(const IoContextManager&) = delete;

  IoContext ioc_;
  std::unique_ptr<WorkGuard> work_guard_;
  std::thread io_thread_;
  std::atomic<bool> running_{false};
  mutable std::mutex mutex_;
};

}  // namespace common
}  // namespace serialtrack
