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

#include <boost/asio/any_io_executor.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include "serialtrack/base/visibility.hpp"
#include "serialtrack/config/connection_config.hpp"
#include "serialtrack/discovery/device_scanner.hpp"
#include "serialtrack/discovery/port_matcher.hpp"
#include "serialtrack/io/io_engine.hpp"
#include "serialtrack/lock/handle_lock.hpp"
#include "serialtrack/lock/marker_lock.hpp"
#include "serialtrack/lock/process_control.hpp"
#include "serialtrack/transport/serial_transport.hpp"

namespace serialtrack {
namespace connection {

/**
 * @brief Collaborators used to open connections
 *
 * Every member may be left empty to get the default: the shared
 * IoContextManager executor, the POSIX transport, real process control and
 * make_default_scanner().
 */
struct ConnectionContext {
  boost::asio::any_io_executor executor;
  std::shared_ptr<transport::TransportFactory> transport_factory;
  std::shared_ptr<lock::ProcessControl> process_control;
  std::shared_ptr<discovery::DeviceScanner> scanner;
};

/**
 * @brief An open, locked serial port with a running I/O engine
 *
 * Opening takes the marker lock, opens and configures the device, takes the
 * handle-level lock and starts the engine. Closing undoes these in reverse.
 *
 * @code
 * auto conn = SerialConnection::open("/dev/ttyUSB0");
 * conn->write("AT\r\n");
 * auto reply = conn->read_sync(std::chrono::seconds(1));
 * @endcode
 */
class SERIALTRACK_API SerialConnection {
 public:
  /**
   * @throws ConfigurationException, PortBusyException, OpenException
   */
  static std::shared_ptr<SerialConnection> open(const std::string& port, const config::ConnectionConfig& cfg = {},
                                                const ConnectionContext& ctx = {});

  /**
   * @brief Scan for ports and open the single one matching @p match
   * @throws OpenException when no port or more than one port matches
   */
  static std::shared_ptr<SerialConnection> open_matching(const std::string& match,
                                                         const config::ConnectionConfig& cfg = {},
                                                         const ConnectionContext& ctx = {});
  static std::shared_ptr<SerialConnection> open_matching(const discovery::PortMatcher& matcher,
                                                         const config::ConnectionConfig& cfg = {},
                                                         const ConnectionContext& ctx = {});

  ~SerialConnection();

  SerialConnection(const SerialConnection&) = delete;
  SerialConnection& operator=(const SerialConnection&) = delete;

  /**
   * @brief Stop I/O and release the device. Idempotent.
   *
   * Pending and later operations fail with IoClosedException.
   */
  void close();
  bool is_closed() const;

  const std::string& port_name() const { return port_; }

  /**
   * @brief OS descriptor of the device, -1 once closed
   */
  int fileno() const;

  io::Bytes read_sync(util::Timeout timeout = std::nullopt, size_t max_bytes = io::kUnlimited) {
    return engine_->read_sync(timeout, max_bytes);
  }
  void write(const uint8_t* data, size_t size) { engine_->write(data, size); }
  void write(const io::Bytes& data) { engine_->write(data); }
  void write(std::string_view data) { engine_->write(data); }
  bool drain_sync(util::Timeout timeout = std::nullopt, size_t threshold = 0) {
    return engine_->drain_sync(timeout, threshold);
  }

  size_t incoming_size() const { return engine_->incoming_size(); }
  size_t outgoing_size() const { return engine_->outgoing_size(); }

  transport::SerialSignals get_signals() { return engine_->get_signals(); }
  void set_signals(std::optional<bool> dtr, std::optional<bool> rts = std::nullopt,
                   std::optional<bool> send_break = std::nullopt) {
    engine_->set_signals(dtr, rts, send_break);
  }

  template <typename CompletionToken>
  auto async_read(CompletionToken&& token, size_t max_bytes = io::kUnlimited) {
    return engine_->async_read(std::forward<CompletionToken>(token), max_bytes);
  }

  template <typename CompletionToken>
  auto async_drain(CompletionToken&& token, size_t threshold = 0) {
    return engine_->async_drain(std::forward<CompletionToken>(token), threshold);
  }

  const io::IoEngine::Executor& get_executor() const { return engine_->get_executor(); }
  const std::shared_ptr<io::IoEngine>& engine() const { return engine_; }

 private:
  SerialConnection(std::string port, std::unique_ptr<lock::MarkerLock> marker,
                   std::unique_ptr<lock::HandleLock> handle_lock, std::shared_ptr<io::IoEngine> engine);

  std::string port_;
  std::unique_ptr<lock::MarkerLock> marker_;
  std::unique_ptr<lock::HandleLock> handle_lock_;
  std::shared_ptr<io::IoEngine> engine_;

  mutable std::mutex close_mutex_;
  bool closed_{false};
};

SERIALTRACK_API std::ostream& operator<<(std::ostream& os, const SerialConnection& conn);

}  // namespace connection
}  // namespace serialtrack
