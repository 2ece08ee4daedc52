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
#include <boost/asio/io_context.hpp>
#include <boost/asio/serial_port.hpp>
#include <memory>
#include <string>

#include "serialtrack/base/visibility.hpp"
#include "serialtrack/transport/serial_transport.hpp"

namespace serialtrack {
namespace transport {

namespace net = boost::asio;

/**
 * @brief Serial transport over a POSIX tty
 *
 * Boost.Asio's serial_port opens the device and applies the line settings
 * (raw mode, baud, framing, flow control). Blocking reads and writes wait in
 * poll(2) on the device together with a wake pipe, which is how
 * cancel_pending() interrupts them.
 */
class SERIALTRACK_API PosixSerialTransport : public SerialTransport {
 public:
  explicit PosixSerialTransport(std::string port);
  ~PosixSerialTransport() override;

  PosixSerialTransport(const PosixSerialTransport&) = delete;
  PosixSerialTransport& operator=(const PosixSerialTransport&) = delete;

  void open(const config::ConnectionConfig& cfg, boost::system::error_code& ec);

  const std::string& name() const override { return port_name_; }
  bool is_open() const override;
  int native_handle() const override;

  size_t read_some(uint8_t* data, size_t size, boost::system::error_code& ec) override;
  size_t bytes_available(boost::system::error_code& ec) override;
  void write_all(const uint8_t* data, size_t size, boost::system::error_code& ec) override;
  void flush(boost::system::error_code& ec) override;
  void cancel_pending(boost::system::error_code& ec) override;

  SerialSignals get_signals(boost::system::error_code& ec) override;
  void set_dtr(bool on, boost::system::error_code& ec) override;
  void set_rts(bool on, boost::system::error_code& ec) override;
  void set_break(bool on, boost::system::error_code& ec) override;

  void close(boost::system::error_code& ec) override;

 private:
  bool configure(const config::ConnectionConfig& cfg, boost::system::error_code& ec);
  bool wait_ready(short events, boost::system::error_code& ec);
  void set_modem_bit(int bit, bool on, boost::system::error_code& ec);

  std::string port_name_;
  net::io_context ioc_;
  net::serial_port port_;
  std::atomic<int> fd_{-1};
  int wake_fds_[2] = {-1, -1};
  std::atomic<bool> sending_break_{false};
};

class SERIALTRACK_API PosixTransportFactory : public TransportFactory {
 public:
  std::unique_ptr<SerialTransport> open(const std::string& port, const config::ConnectionConfig& cfg,
                                        boost::system::error_code& ec) override;
};

SERIALTRACK_API std::shared_ptr<TransportFactory> default_transport_factory();

}  // namespace transport
}  // namespace serialtrack
