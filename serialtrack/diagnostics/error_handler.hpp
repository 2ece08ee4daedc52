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
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "serialtrack/base/visibility.hpp"
#include "serialtrack/diagnostics/error_types.hpp"

namespace serialtrack {
namespace diagnostics {

/**
 * @brief Centralized error handling system
 *
 * Collects error records from every component, keeps statistics and a
 * bounded history, and forwards each record to registered callbacks.
 */
class SERIALTRACK_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  /**
   * @brief Get singleton instance
   */
  static ErrorHandler& instance();

  ErrorHandler();
  ~ErrorHandler();

  /**
   * @brief Report an error
   * @param error Error information to report
   */
  void report_error(const ErrorInfo& error);

  /**
   * @brief Register error callback
   * @param callback Function to call when errors occur
   */
  void register_callback(ErrorCallback callback);
  void clear_callbacks();

  /**
   * @brief Set minimum error level to report
   * @param level Minimum level (errors below this level are ignored)
   */
  void set_min_error_level(ErrorLevel level);
  ErrorLevel get_min_error_level() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  ErrorStats get_error_stats() const;

  /**
   * @brief Reset statistics and drop the stored history
   */
  void reset_stats();

  std::vector<ErrorInfo> get_errors_by_component(const std::string& component) const;

  /**
   * @brief Get recent errors
   * @param count Maximum number of recent errors to return
   */
  std::vector<ErrorInfo> get_recent_errors(size_t count = 10) const;

  bool has_errors(const std::string& component) const;
  size_t get_error_count(const std::string& component, ErrorLevel level) const;

 private:
  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;

  mutable std::mutex mutex_;
  std::vector<ErrorCallback> callbacks_;
  std::atomic<ErrorLevel> min_level_{ErrorLevel::INFO};
  std::atomic<bool> enabled_{true};

  ErrorStats stats_;
  std::vector<ErrorInfo> recent_errors_;
  std::unordered_map<std::string, std::vector<ErrorInfo>> errors_by_component_;

  void update_stats(const ErrorInfo& error);
  void notify_callbacks(const std::vector<ErrorCallback>& callbacks, const ErrorInfo& error);
  void add_to_recent_errors(const ErrorInfo& error);
  void add_to_component_errors(const ErrorInfo& error);
};

/**
 * @brief Convenience functions for common error reporting scenarios
 */
namespace error_reporting {

/**
 * @brief Report a failed read/write on an open device
 * @param component Component name (e.g., "engine")
 * @param operation Operation that failed (e.g., "read", "write")
 * @param port Device path
 * @param ec Error code from the transport
 */
SERIALTRACK_API void report_io_error(const std::string& component, const std::string& operation,
                                     const std::string& port, const boost::system::error_code& ec);

/**
 * @brief Report a device that could not be opened
 * @param retryable True when the tracker will try again later
 */
SERIALTRACK_API void report_open_error(const std::string& component, const std::string& port,
                                       const std::string& message, const boost::system::error_code& ec,
                                       bool retryable = true);

/**
 * @brief Report a non-fatal lock layer failure (logged, acquisition continued)
 */
SERIALTRACK_API void report_lock_warning(const std::string& operation, const std::string& port,
                                         const std::string& message,
                                         const boost::system::error_code& ec = boost::system::error_code{});

/**
 * @brief Report a port enumeration failure
 */
SERIALTRACK_API void report_scan_error(const std::string& component, const std::string& message);

SERIALTRACK_API void report_info(const std::string& component, const std::string& operation,
                                 const std::string& message);

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace serialtrack
