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

#include "serialtrack/transport/posix_serial_transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <boost/asio/error.hpp>
#include <cerrno>

#include "serialtrack/diagnostics/logger.hpp"

namespace serialtrack {
namespace transport {

using config::ConnectionConfig;

namespace {

boost::system::error_code last_error() { return boost::system::error_code(errno, boost::system::system_category()); }

}  // namespace

PosixSerialTransport::PosixSerialTransport(std::string port) : port_name_(std::move(port)), port_(ioc_) {}

PosixSerialTransport::~PosixSerialTransport() {
  boost::system::error_code ec;
  close(ec);
}

void PosixSerialTransport::open(const ConnectionConfig& cfg, boost::system::error_code& ec) {
  ec.clear();
  if (::pipe2(wake_fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
    ec = last_error();
    SERIALTRACK_LOG_ERROR("transport", "open", "Failed to create wake pipe: " + ec.message());
    return;
  }

  port_.open(port_name_, ec);
  if (ec) {
    SERIALTRACK_LOG_DEBUG("transport", "open", "Failed to open device: " + port_name_ + " - " + ec.message());
    boost::system::error_code ignored;
    close(ignored);
    return;
  }

  if (!configure(cfg, ec)) {
    boost::system::error_code ignored;
    close(ignored);
    return;
  }

  SERIALTRACK_LOG_DEBUG("transport", "open", "Device opened: " + port_name_ + " @ " + std::to_string(cfg.baud_rate));
}

bool PosixSerialTransport::configure(const ConnectionConfig& cfg, boost::system::error_code& ec) {
  port_.set_option(net::serial_port_base::baud_rate(cfg.baud_rate), ec);
  if (ec) {
    SERIALTRACK_LOG_ERROR("transport", "configure",
                          "Failed to set baud rate: " + std::to_string(cfg.baud_rate) + " - " + ec.message());
    return false;
  }

  port_.set_option(net::serial_port_base::character_size(cfg.char_size), ec);
  if (ec) {
    SERIALTRACK_LOG_ERROR("transport", "configure",
                          "Failed to set character size: " + std::to_string(cfg.char_size) + " - " + ec.message());
    return false;
  }

  using sb = net::serial_port_base::stop_bits;
  port_.set_option(sb(cfg.stop_bits == 2 ? sb::two : sb::one), ec);
  if (ec) {
    SERIALTRACK_LOG_ERROR("transport", "configure",
                          "Failed to set stop bits: " + std::to_string(cfg.stop_bits) + " - " + ec.message());
    return false;
  }

  using pa = net::serial_port_base::parity;
  pa::type p = pa::none;
  if (cfg.parity == ConnectionConfig::Parity::Even)
    p = pa::even;
  else if (cfg.parity == ConnectionConfig::Parity::Odd)
    p = pa::odd;
  port_.set_option(pa(p), ec);
  if (ec) {
    SERIALTRACK_LOG_ERROR("transport", "configure", "Failed to set parity - " + ec.message());
    return false;
  }

  using fc = net::serial_port_base::flow_control;
  fc::type f = fc::none;
  if (cfg.flow == ConnectionConfig::Flow::Software)
    f = fc::software;
  else if (cfg.flow == ConnectionConfig::Flow::Hardware)
    f = fc::hardware;
  port_.set_option(fc(f), ec);
  if (ec) {
    SERIALTRACK_LOG_ERROR("transport", "configure", "Failed to set flow control - " + ec.message());
    return false;
  }

  // Reads and writes wait in poll(), the descriptor itself never blocks
  int fd = port_.native_handle();
  int flags = ::fcntl(fd, F_GETFL);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    ec = last_error();
    SERIALTRACK_LOG_ERROR("transport", "configure", "Failed to set O_NONBLOCK - " + ec.message());
    return false;
  }
  fd_ = fd;
  return true;
}

bool PosixSerialTransport::is_open() const { return fd_ >= 0; }

int PosixSerialTransport::native_handle() const { return fd_; }

bool PosixSerialTransport::wait_ready(short events, boost::system::error_code& ec) {
  pollfd fds[2] = {{fd_, events, 0}, {wake_fds_[0], POLLIN, 0}};
  for (;;) {
    int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR) continue;
      ec = last_error();
      return false;
    }
    if (fds[1].revents != 0) {
      ec = net::error::operation_aborted;
      return false;
    }
    if (fds[0].revents & POLLNVAL) {
      ec = net::error::bad_descriptor;
      return false;
    }
    // POLLERR and POLLHUP are left for read()/write() to report
    if (fds[0].revents != 0) return true;
  }
}

size_t PosixSerialTransport::read_some(uint8_t* data, size_t size, boost::system::error_code& ec) {
  ec.clear();
  if (fd_ < 0) {
    ec = net::error::bad_descriptor;
    return 0;
  }
  if (size == 0) return 0;

  for (;;) {
    ssize_t n = ::read(fd_, data, size);
    if (n > 0) return static_cast<size_t>(n);
    if (n == 0) {
      // readable but no data: the device went away
      ec = net::error::eof;
      return 0;
    }
    if (errno == EINTR) continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      ec = last_error();
      return 0;
    }
    if (!wait_ready(POLLIN, ec)) return 0;
  }
}

size_t PosixSerialTransport::bytes_available(boost::system::error_code& ec) {
  ec.clear();
  int count = 0;
  if (::ioctl(fd_, FIONREAD, &count) != 0) {
    ec = last_error();
    return 0;
  }
  return count > 0 ? static_cast<size_t>(count) : 0;
}

void PosixSerialTransport::write_all(const uint8_t* data, size_t size, boost::system::error_code& ec) {
  ec.clear();
  if (fd_ < 0) {
    ec = net::error::bad_descriptor;
    return;
  }

  size_t written = 0;
  while (written < size) {
    ssize_t n = ::write(fd_, data + written, size - written);
    if (n > 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      ec = last_error();
      return;
    }
    if (!wait_ready(POLLOUT, ec)) return;
  }
}

void PosixSerialTransport::flush(boost::system::error_code& ec) {
  ec.clear();
  while (::tcdrain(fd_) != 0) {
    if (errno == EINTR) continue;
    ec = last_error();
    return;
  }
}

void PosixSerialTransport::cancel_pending(boost::system::error_code& ec) {
  ec.clear();
  if (wake_fds_[1] < 0) {
    ec = net::error::bad_descriptor;
    return;
  }
  const char byte = 0;
  if (::write(wake_fds_[1], &byte, 1) < 0 && errno != EAGAIN) {
    ec = last_error();
  }
}

SerialSignals PosixSerialTransport::get_signals(boost::system::error_code& ec) {
  ec.clear();
  SerialSignals signals;
  int bits = 0;
  if (::ioctl(fd_, TIOCMGET, &bits) != 0) {
    ec = last_error();
    return signals;
  }
  signals.dtr = (bits & TIOCM_DTR) != 0;
  signals.dsr = (bits & TIOCM_DSR) != 0;
  signals.cts = (bits & TIOCM_CTS) != 0;
  signals.rts = (bits & TIOCM_RTS) != 0;
  signals.ri = (bits & TIOCM_RI) != 0;
  signals.cd = (bits & TIOCM_CD) != 0;
  signals.sending_break = sending_break_.load();
  return signals;
}

void PosixSerialTransport::set_modem_bit(int bit, bool on, boost::system::error_code& ec) {
  ec.clear();
  if (::ioctl(fd_, on ? TIOCMBIS : TIOCMBIC, &bit) != 0) {
    ec = last_error();
  }
}

void PosixSerialTransport::set_dtr(bool on, boost::system::error_code& ec) { set_modem_bit(TIOCM_DTR, on, ec); }

void PosixSerialTransport::set_rts(bool on, boost::system::error_code& ec) { set_modem_bit(TIOCM_RTS, on, ec); }

void PosixSerialTransport::set_break(bool on, boost::system::error_code& ec) {
  ec.clear();
  if (::ioctl(fd_, on ? TIOCSBRK : TIOCCBRK) != 0) {
    ec = last_error();
    return;
  }
  sending_break_.store(on);
}

void PosixSerialTransport::close(boost::system::error_code& ec) {
  ec.clear();
  fd_ = -1;
  if (port_.is_open()) {
    port_.close(ec);
    if (ec) {
      SERIALTRACK_LOG_WARNING("transport", "close", "Failed to close " + port_name_ + " - " + ec.message());
    }
  }
  for (int& fd : wake_fds_) {
    if (fd >= 0) {
      ::close(fd);
      fd = -1;
    }
  }
}

std::unique_ptr<SerialTransport> PosixTransportFactory::open(const std::string& port, const ConnectionConfig& cfg,
                                                             boost::system::error_code& ec) {
  auto transport = std::make_unique<PosixSerialTransport>(port);
  transport->open(cfg, ec);
  if (ec) {
    return nullptr;
  }
  return transport;
}

std::shared_ptr<TransportFactory> default_transport_factory() {
  static auto instance = std::make_shared<PosixTransportFactory>();
  return instance;
}

}  // namespace transport
}  // namespace serialtrack
