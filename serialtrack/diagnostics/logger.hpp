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

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "serialtrack/base/visibility.hpp"

#ifdef DEBUG
#undef DEBUG
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef WARNING
#undef WARNING
#endif
#ifdef ERROR
#undef ERROR
#endif
#ifdef CALLBACK
#undef CALLBACK
#endif

namespace serialtrack {
namespace diagnostics {

/**
 * @brief Log severity levels
 */
enum class LogLevel { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3 };

/**
 * @brief Log output destinations
 */
enum class LogOutput { CONSOLE = 0x01, FILE = 0x02, CALLBACK = 0x04 };

/**
 * @brief Centralized logging system
 *
 * Thread-safe logger with console, file and callback outputs. Every message
 * is tagged with the component and operation that produced it.
 */
class SERIALTRACK_API Logger {
 public:
  using LogCallback = std::function<void(LogLevel level, const std::string& formatted_message)>;

  /**
   * @brief Get singleton instance
   */
  static Logger& instance();

  Logger();
  ~Logger();

  /**
   * @brief Set minimum log level
   * @param level Messages below this level will be ignored
   */
  void set_level(LogLevel level);
  LogLevel get_level() const;

  /**
   * @brief Set file output
   * @param filename Log file path (empty string to disable file output)
   */
  void set_file_output(const std::string& filename);

  /**
   * @brief Set log callback
   * @param callback Function to call for each formatted line, nullptr to remove it
   */
  void set_callback(LogCallback callback);

  /**
   * @brief Set output destinations
   * @param outputs Bitwise OR of LogOutput flags
   */
  void set_outputs(int outputs);

  void flush();

  /**
   * Lines read "<timestamp> [<level>] [<component>] [<operation>] <message>".
   */
  void log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message);

  void debug(std::string_view component, std::string_view operation, std::string_view message);
  void info(std::string_view component, std::string_view operation, std::string_view message);
  void warning(std::string_view component, std::string_view operation, std::string_view message);
  void error(std::string_view component, std::string_view operation, std::string_view message);

 private:
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/**
 * @brief Convenience macros for logging
 */
#define SERIALTRACK_LOG_DEBUG(component, operation, message)                                                     \
  do {                                                                                                           \
    if (serialtrack::diagnostics::Logger::instance().get_level() <= serialtrack::diagnostics::LogLevel::DEBUG) { \
      serialtrack::diagnostics::Logger::instance().debug(component, operation, message);                         \
    }                                                                                                            \
  } while (0)

#define SERIALTRACK_LOG_INFO(component, operation, message)                                                     \
  do {                                                                                                          \
    if (serialtrack::diagnostics::Logger::instance().get_level() <= serialtrack::diagnostics::LogLevel::INFO) { \
      serialtrack::diagnostics::Logger::instance().info(component, operation, message);                         \
    }                                                                                                           \
  } while (0)

#define SERIALTRACK_LOG_WARNING(component, operation, message)                                                     \
  do {                                                                                                             \
    if (serialtrack::diagnostics::Logger::instance().get_level() <= serialtrack::diagnostics::LogLevel::WARNING) { \
      serialtrack::diagnostics::Logger::instance().warning(component, operation, message);                         \
    }                                                                                                              \
  } while (0)

#define SERIALTRACK_LOG_ERROR(component, operation, message)                                                     \
  do {                                                                                                           \
    if (serialtrack::diagnostics::Logger::instance().get_level() <= serialtrack::diagnostics::LogLevel::ERROR) { \
      serialtrack::diagnostics::Logger::instance().error(component, operation, message);                         \
    }                                                                                                            \
  } while (0)

}  // namespace diagnostics
}  // namespace serialtrack
