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

#include "serialtrack/io/io_engine.hpp"

#include <algorithm>
#include <boost/asio/error.hpp>
#include <stdexcept>

#include "serialtrack/common/io_context_manager.hpp"
#include "serialtrack/diagnostics/error_handler.hpp"
#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/diagnostics/logger.hpp"

namespace serialtrack {
namespace io {

using diagnostics::IoClosedException;
using diagnostics::IoException;

std::shared_ptr<IoEngine> IoEngine::create(std::unique_ptr<transport::SerialTransport> transport,
                                           const config::ConnectionConfig& cfg, Executor executor) {
  if (!transport) {
    throw std::invalid_argument("IoEngine requires a transport");
  }
  if (!executor) {
    executor = common::IoContextManager::instance().get_executor();
  }
  return std::shared_ptr<IoEngine>(new IoEngine(std::move(transport), cfg, std::move(executor)));
}

IoEngine::IoEngine(std::unique_ptr<transport::SerialTransport> transport, const config::ConnectionConfig& cfg,
                   Executor executor)
    : port_name_(transport->name()),
      transport_(std::move(transport)),
      write_chunk_(cfg.write_chunk),
      read_chunk_(cfg.read_chunk),
      executor_(std::move(executor)) {}

IoEngine::~IoEngine() {
  close();
  close_transport();
}

void IoEngine::start() {
  std::lock_guard<std::mutex> guard(join_mutex_);
  if (reader_.joinable() || writer_.joinable() || is_closed()) {
    return;
  }
  reader_ = std::thread([this]() { read_loop(); });
  writer_ = std::thread([this]() { write_loop(); });
  SERIALTRACK_LOG_DEBUG("engine", "start", "Started I/O threads for " + port_name_);
}

bool IoEngine::wait_until(std::unique_lock<std::mutex>& lock, util::Deadline deadline) {
  if (util::is_unbounded(deadline)) {
    cv_.wait(lock);
    return true;
  }
  if (util::Clock::now() >= deadline) {
    return false;
  }
  cv_.wait_until(lock, deadline);
  return true;
}

Bytes IoEngine::read_sync(util::Timeout timeout, size_t max_bytes) {
  const util::Deadline deadline = util::to_deadline(timeout);
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    // Data that arrived before a fault is still delivered
    if (!incoming_.empty()) {
      const size_t n = std::min(max_bytes, incoming_.size());
      Bytes out(incoming_.begin(), incoming_.begin() + n);
      incoming_.erase(incoming_.begin(), incoming_.begin() + n);
      return out;
    }
    if (fault_) {
      std::rethrow_exception(fault_);
    }
    if (!wait_until(lock, deadline)) {
      return {};
    }
  }
}

void IoEngine::write(const uint8_t* data, size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fault_) {
    std::rethrow_exception(fault_);
  }
  if (size == 0) {
    return;
  }
  outgoing_.insert(outgoing_.end(), data, data + size);
  cv_.notify_all();
}

bool IoEngine::drain_sync(util::Timeout timeout, size_t threshold) {
  const util::Deadline deadline = util::to_deadline(timeout);
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    if (fault_) {
      std::rethrow_exception(fault_);
    }
    if (outgoing_.size() <= threshold) {
      return true;
    }
    if (!wait_until(lock, deadline)) {
      return false;
    }
  }
}

size_t IoEngine::incoming_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return incoming_.size();
}

size_t IoEngine::outgoing_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return outgoing_.size();
}

transport::SerialSignals IoEngine::get_signals() {
  boost::system::error_code ec;
  {
    // Held across the call so close() can't release the handle underneath it
    std::lock_guard<std::mutex> lock(mutex_);
    if (fault_) {
      std::rethrow_exception(fault_);
    }
    auto signals = transport_->get_signals(ec);
    if (!ec) {
      return signals;
    }
  }
  std::rethrow_exception(signal_fault("get_signals", "Can't get control signals", ec));
}

void IoEngine::set_signals(std::optional<bool> dtr, std::optional<bool> rts, std::optional<bool> send_break) {
  boost::system::error_code ec;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fault_) {
      std::rethrow_exception(fault_);
    }
    if (dtr) {
      transport_->set_dtr(*dtr, ec);
    }
    if (!ec && rts) {
      transport_->set_rts(*rts, ec);
    }
    if (!ec && send_break) {
      transport_->set_break(*send_break, ec);
    }
    if (!ec) {
      return;
    }
  }
  std::rethrow_exception(signal_fault("set_signals", "Can't set control signals", ec));
}

std::exception_ptr IoEngine::signal_fault(const std::string& operation, const std::string& message,
                                          const boost::system::error_code& ec) {
  diagnostics::error_reporting::report_io_error("engine", operation, port_name_, ec);
  std::lock_guard<std::mutex> lock(mutex_);
  record_fault_locked(std::make_exception_ptr(IoException(message, port_name_, operation, ec)));
  return fault_;
}

void IoEngine::close() {
  bool first = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) {
      first = true;
      closed_ = true;
      fault_ = std::make_exception_ptr(IoClosedException(port_name_, fault_));
      incoming_.clear();
      outgoing_.clear();
      resolve_wakers(take_wakers_locked());
      cv_.notify_all();
    }
  }

  if (first) {
    boost::system::error_code ec;
    transport_->cancel_pending(ec);
    if (ec) {
      SERIALTRACK_LOG_WARNING("engine", "close", "Failed to cancel pending I/O on " + port_name_ + ": " + ec.message());
    }
  }

  std::lock_guard<std::mutex> guard(join_mutex_);
  for (std::thread* worker : {&reader_, &writer_}) {
    if (!worker->joinable()) {
      continue;
    }
    if (worker->get_id() == std::this_thread::get_id()) {
      SERIALTRACK_LOG_ERROR("engine", "close", "close() called from an I/O thread of " + port_name_);
      continue;
    }
    worker->join();
  }
  if (first) {
    SERIALTRACK_LOG_DEBUG("engine", "close", "Closed " + port_name_);
  }
}

void IoEngine::close_transport() {
  if (!transport_->is_open()) {
    return;
  }
  boost::system::error_code ec;
  transport_->close(ec);
  if (ec) {
    SERIALTRACK_LOG_WARNING("engine", "close", "Failed to close " + port_name_ + ": " + ec.message());
  }
}

bool IoEngine::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::exception_ptr IoEngine::fault() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fault_;
}

int IoEngine::native_handle() const { return transport_->native_handle(); }

void IoEngine::record_fault_locked(std::exception_ptr fault) {
  if (!fault_) {
    fault_ = std::move(fault);
  }
  resolve_wakers(take_wakers_locked());
  cv_.notify_all();
}

std::vector<IoEngine::Waker> IoEngine::take_wakers_locked() {
  std::vector<Waker> wakers;
  wakers.swap(wakers_);
  return wakers;
}

void IoEngine::resolve_wakers(std::vector<Waker> wakers) {
  if (wakers.empty()) {
    return;
  }
  // Timers are only touched from the executor; expiring at min() is sticky
  for (auto& waker : wakers) {
    boost::asio::post(executor_, [waker]() { waker->expires_at(boost::asio::steady_timer::time_point::min()); });
  }
}

IoEngine::Waker IoEngine::register_waker() {
  auto waker = std::make_shared<boost::asio::steady_timer>(executor_, boost::asio::steady_timer::time_point::max());
  std::lock_guard<std::mutex> lock(mutex_);
  wakers_.push_back(waker);
  return waker;
}

void IoEngine::drop_waker(const Waker& waker) {
  std::lock_guard<std::mutex> lock(mutex_);
  wakers_.erase(std::remove(wakers_.begin(), wakers_.end(), waker), wakers_.end());
}

void IoEngine::read_loop() {
  Bytes buffer(read_chunk_);
  Bytes extra;
  for (;;) {
    boost::system::error_code ec;
    size_t n = transport_->read_some(buffer.data(), buffer.size(), ec);
    if (!ec && n == 0) {
      ec = boost::asio::error::eof;
    }

    size_t m = 0;
    if (!ec) {
      size_t available = transport_->bytes_available(ec);
      if (!ec && available > 0) {
        extra.resize(available);
        m = transport_->read_some(extra.data(), available, ec);
        if (!ec && m == 0) {
          ec = boost::asio::error::eof;
        }
      }
    }

    size_t buffered = 0;
    bool faulted = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!closed_ && n + m > 0) {
        incoming_.insert(incoming_.end(), buffer.begin(), buffer.begin() + n);
        incoming_.insert(incoming_.end(), extra.begin(), extra.begin() + m);
        buffered = incoming_.size();
      }
      faulted = static_cast<bool>(fault_);
      if (!ec) {
        resolve_wakers(take_wakers_locked());
        cv_.notify_all();
      }
    }
    if (buffered > 0) {
      SERIALTRACK_LOG_DEBUG("engine", "read",
                            "Read " + std::to_string(n + m) + " bytes, buffered " + std::to_string(buffered));
    }
    if (!ec) {
      continue;
    }

    if (!faulted) {
      SERIALTRACK_LOG_ERROR("engine", "read", "Serial read error on " + port_name_ + ": " + ec.message());
      diagnostics::error_reporting::report_io_error("engine", "read", port_name_, ec);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    record_fault_locked(std::make_exception_ptr(IoException("Serial read error", port_name_, "read", ec)));
    return;
  }
}

void IoEngine::write_loop() {
  Bytes chunk;
  std::unique_lock<std::mutex> lock(mutex_);
  for (;;) {
    cv_.wait(lock, [this]() { return fault_ || !outgoing_.empty(); });
    if (fault_) {
      return;
    }

    const size_t n = std::min(write_chunk_, outgoing_.size());
    chunk.assign(outgoing_.begin(), outgoing_.begin() + n);
    lock.unlock();

    boost::system::error_code ec;
    transport_->write_all(chunk.data(), chunk.size(), ec);
    if (!ec) {
      transport_->flush(ec);
    }

    if (ec) {
      lock.lock();
      const bool faulted = static_cast<bool>(fault_);
      lock.unlock();
      if (!faulted) {
        SERIALTRACK_LOG_ERROR("engine", "write", "Serial write error on " + port_name_ + ": " + ec.message());
        diagnostics::error_reporting::report_io_error("engine", "write", port_name_, ec);
      }
      lock.lock();
      record_fault_locked(std::make_exception_ptr(IoException("Serial write error", port_name_, "write", ec)));
      return;
    }

    lock.lock();
    // close() may have discarded the buffer meanwhile
    outgoing_.erase(outgoing_.begin(), outgoing_.begin() + std::min(n, outgoing_.size()));
    const size_t pending = outgoing_.size();
    resolve_wakers(take_wakers_locked());
    cv_.notify_all();
    lock.unlock();
    SERIALTRACK_LOG_DEBUG("engine", "write",
                          "Wrote " + std::to_string(n) + " bytes, pending " + std::to_string(pending));
    lock.lock();
  }
}

}  // namespace io
}  // namespace serialtrack
