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

#include "serialtrack/connection/serial_connection.hpp"

#include <boost/system/error_code.hpp>

#include "serialtrack/diagnostics/error_handler.hpp"
#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/diagnostics/logger.hpp"
#include "serialtrack/discovery/glob_matcher.hpp"
#include "serialtrack/transport/posix_serial_transport.hpp"

namespace serialtrack {
namespace connection {

using diagnostics::ConfigurationException;
using diagnostics::OpenException;
using diagnostics::PortBusyException;

std::shared_ptr<SerialConnection> SerialConnection::open(const std::string& port, const config::ConnectionConfig& cfg,
                                                         const ConnectionContext& ctx) {
  if (!cfg.is_valid()) {
    throw ConfigurationException("Invalid connection settings for " + port, "connection");
  }

  auto process = ctx.process_control ? ctx.process_control : lock::default_process_control();
  auto factory = ctx.transport_factory ? ctx.transport_factory : transport::default_transport_factory();

  // Each step below is undone by the destructors of the earlier ones if it throws
  auto marker = std::make_unique<lock::MarkerLock>(port, cfg.sharing, cfg.lock_dir, process);

  boost::system::error_code ec;
  auto device = factory->open(port, cfg, ec);
  if (!device) {
    if (ec == boost::system::errc::device_or_resource_busy) {
      diagnostics::error_reporting::report_open_error("connection", port, "Serial port busy (EBUSY)", ec);
      throw PortBusyException("Serial port busy (EBUSY)", port, ec);
    }
    SERIALTRACK_LOG_ERROR("connection", "open", "Serial port open error: " + port + " - " + ec.message());
    diagnostics::error_reporting::report_open_error("connection", port, "Serial port open error", ec);
    throw OpenException("Serial port open error", port, ec);
  }

  std::unique_ptr<lock::HandleLock> handle_lock;
  const int fd = device->native_handle();
  if (fd >= 0) {
    handle_lock = std::make_unique<lock::HandleLock>(fd, port, cfg.sharing);
  }

  auto engine = io::IoEngine::create(std::move(device), cfg, ctx.executor);
  engine->start();

  SERIALTRACK_LOG_INFO("connection", "open",
                       "Opened " + port + " (" + std::to_string(cfg.baud_rate) + " baud, " +
                           lock::to_string(cfg.sharing) + ")");
  return std::shared_ptr<SerialConnection>(
      new SerialConnection(port, std::move(marker), std::move(handle_lock), std::move(engine)));
}

std::shared_ptr<SerialConnection> SerialConnection::open_matching(const std::string& match,
                                                                  const config::ConnectionConfig& cfg,
                                                                  const ConnectionContext& ctx) {
  discovery::GlobMatcher matcher(match);
  return open_matching(matcher, cfg, ctx);
}

std::shared_ptr<SerialConnection> SerialConnection::open_matching(const discovery::PortMatcher& matcher,
                                                                  const config::ConnectionConfig& cfg,
                                                                  const ConnectionContext& ctx) {
  auto scanner = ctx.scanner ? ctx.scanner : discovery::make_default_scanner();
  const auto ports = scanner->scan();
  if (ports.empty()) {
    throw OpenException("No ports found");
  }

  const auto matched = matcher.filter(ports);
  if (matched.empty()) {
    throw OpenException("No ports match '" + matcher.str() + "'");
  }
  if (matched.size() > 1) {
    std::string names;
    for (const auto& port : matched) {
      names += (names.empty() ? "" : ", ") + port.name;
    }
    throw OpenException("Multiple ports match '" + matcher.str() + "': " + names);
  }

  SERIALTRACK_LOG_DEBUG("connection", "open", "'" + matcher.str() + "' matched " + matched.front().name);
  return open(matched.front().name, cfg, ctx);
}

SerialConnection::SerialConnection(std::string port, std::unique_ptr<lock::MarkerLock> marker,
                                   std::unique_ptr<lock::HandleLock> handle_lock, std::shared_ptr<io::IoEngine> engine)
    : port_(std::move(port)),
      marker_(std::move(marker)),
      handle_lock_(std::move(handle_lock)),
      engine_(std::move(engine)) {}

SerialConnection::~SerialConnection() {
  try {
    close();
  } catch (const std::exception& e) {
    SERIALTRACK_LOG_ERROR("connection", "close", "Error closing " + port_ + ": " + e.what());
  }
}

void SerialConnection::close() {
  std::lock_guard<std::mutex> guard(close_mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;

  engine_->close();
  if (handle_lock_) {
    handle_lock_->release();
  }
  engine_->close_transport();
  if (marker_) {
    marker_->release();
  }
  SERIALTRACK_LOG_INFO("connection", "close", "Closed " + port_);
}

bool SerialConnection::is_closed() const {
  std::lock_guard<std::mutex> guard(close_mutex_);
  return closed_;
}

int SerialConnection::fileno() const {
  std::lock_guard<std::mutex> guard(close_mutex_);
  return closed_ ? -1 : engine_->native_handle();
}

std::ostream& operator<<(std::ostream& os, const SerialConnection& conn) {
  return os << "SerialConnection(" << conn.port_name() << ")";
}

}  // namespace connection
}  // namespace serialtrack
