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
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "serialtrack/config/connection_config.hpp"

namespace serialtrack {
namespace transport {

/**
 * @brief Modem control and break state of a serial line
 */
struct SerialSignals {
  bool dtr = false;
  bool dsr = false;
  bool cts = false;
  bool rts = false;
  bool ri = false;
  bool cd = false;
  bool sending_break = false;
};

/**
 * @brief Blocking serial device handle driven by the I/O engine.
 *
 * Read and write calls block the calling thread. cancel_pending() makes
 * every blocked and future read/write fail with operation_aborted so that
 * the engine's worker threads can be joined.
 *
 * read_some/bytes_available run on the reader thread, write_all/flush on
 * the writer thread, signal accessors on caller threads; implementations
 * must allow these to overlap. close() is only called after both workers
 * have exited.
 */
class SerialTransport {
 public:
  virtual ~SerialTransport() = default;

  virtual const std::string& name() const = 0;
  virtual bool is_open() const = 0;

  /**
   * @brief OS descriptor for the handle-level lock, -1 when not backed by one
   */
  virtual int native_handle() const = 0;

  /**
   * @brief Block until at least one byte is read
   * @return Number of bytes stored in @p data, 0 on error
   */
  virtual size_t read_some(uint8_t* data, size_t size, boost::system::error_code& ec) = 0;

  /**
   * @brief Bytes that can be read right now without blocking
   */
  virtual size_t bytes_available(boost::system::error_code& ec) = 0;

  virtual void write_all(const uint8_t* data, size_t size, boost::system::error_code& ec) = 0;

  /**
   * @brief Wait until written bytes have left the OS output queue
   */
  virtual void flush(boost::system::error_code& ec) = 0;

  virtual void cancel_pending(boost::system::error_code& ec) = 0;

  virtual SerialSignals get_signals(boost::system::error_code& ec) = 0;
  virtual void set_dtr(bool on, boost::system::error_code& ec) = 0;
  virtual void set_rts(bool on, boost::system::error_code& ec) = 0;
  virtual void set_break(bool on, boost::system::error_code& ec) = 0;

  virtual void close(boost::system::error_code& ec) = 0;
};

/**
 * @brief Opens and configures transports by device name
 */
class TransportFactory {
 public:
  virtual ~TransportFactory() = default;

  /**
   * @return The open transport, or nullptr with @p ec set
   */
  virtual std::unique_ptr<SerialTransport> open(const std::string& port, const config::ConnectionConfig& cfg,
                                                boost::system::error_code& ec) = 0;
};

}  // namespace transport
}  // namespace serialtrack
