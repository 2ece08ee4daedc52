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

#include <boost/system/error_code.hpp>
#include <exception>
#include <stdexcept>
#include <string>

namespace serialtrack {
namespace diagnostics {

/**
 * @brief Base exception class for all serialtrack errors
 *
 * Carries the device it refers to (if any), the component and operation
 * that raised it, and the underlying OS error code when one exists.
 */
class SerialException : public std::runtime_error {
 public:
  explicit SerialException(const std::string& message, const std::string& port = "",
                           const std::string& component = "", const std::string& operation = "",
                           const boost::system::error_code& ec = boost::system::error_code{})
      : std::runtime_error(message), port_(port), component_(component), operation_(operation), code_(ec) {}

  const std::string& get_port() const noexcept { return port_; }
  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }
  const boost::system::error_code& code() const noexcept { return code_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!port_.empty()) {
      full_msg = port_ + ": " + full_msg;
    }
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    if (code_) {
      full_msg += " (" + code_.message() + ")";
    }
    return full_msg;
  }

 private:
  std::string port_;
  std::string component_;
  std::string operation_;
  boost::system::error_code code_;
};

/**
 * @brief The device could not be opened or configured
 */
class OpenException : public SerialException {
 public:
  explicit OpenException(const std::string& message, const std::string& port = "",
                         const boost::system::error_code& ec = boost::system::error_code{},
                         const std::string& component = "connection")
      : SerialException(message, port, component, "open", ec) {}
};

/**
 * @brief Another process (or another handle in this one) holds the device
 */
class PortBusyException : public OpenException {
 public:
  explicit PortBusyException(const std::string& message, const std::string& port = "",
                             const boost::system::error_code& ec = boost::system::error_code{})
      : OpenException(message, port, ec, "lock") {}
};

/**
 * @brief Read, write or line signal access failed on an open device
 */
class IoException : public SerialException {
 public:
  explicit IoException(const std::string& message, const std::string& port = "", const std::string& operation = "",
                       const boost::system::error_code& ec = boost::system::error_code{})
      : SerialException(message, port, "engine", operation, ec) {}
};

/**
 * @brief The connection was closed deliberately
 *
 * If an I/O fault had already been recorded when the connection closed,
 * it is kept as the cause.
 */
class IoClosedException : public IoException {
 public:
  explicit IoClosedException(const std::string& port = "", std::exception_ptr cause = nullptr)
      : IoException("Serial port closed", port, "close"), cause_(std::move(cause)) {}

  const std::exception_ptr& cause() const noexcept { return cause_; }

 private:
  std::exception_ptr cause_;
};

/**
 * @brief Port enumeration failed
 */
class ScanException : public SerialException {
 public:
  explicit ScanException(const std::string& message, const std::string& source = "")
      : SerialException(message, "", "scanner", "scan"), source_(source) {}

  const std::string& get_source() const noexcept { return source_; }

 private:
  std::string source_;
};

/**
 * @brief A port filter expression could not be parsed
 */
class MatcherException : public SerialException {
 public:
  explicit MatcherException(const std::string& message, const std::string& expression = "", size_t position = 0)
      : SerialException(message, "", "matcher", "parse"), expression_(expression), position_(position) {}

  const std::string& get_expression() const noexcept { return expression_; }
  size_t get_position() const noexcept { return position_; }

 private:
  std::string expression_;
  size_t position_;
};

/**
 * @brief Invalid connection or tracker settings
 */
class ConfigurationException : public SerialException {
 public:
  explicit ConfigurationException(const std::string& message, const std::string& config_section = "")
      : SerialException(message, "", "configuration", "validate"), config_section_(config_section) {}

  const std::string& get_config_section() const noexcept { return config_section_; }

 private:
  std::string config_section_;
};

}  // namespace diagnostics
}  // namespace serialtrack
