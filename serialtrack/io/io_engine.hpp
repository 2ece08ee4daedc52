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
#include <boost/asio/async_result.hpp>
#include <boost/asio/compose.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "serialtrack/base/visibility.hpp"
#include "serialtrack/config/connection_config.hpp"
#include "serialtrack/transport/serial_transport.hpp"
#include "serialtrack/util/deadline.hpp"

namespace serialtrack {
namespace io {

using Bytes = std::vector<uint8_t>;

constexpr size_t kUnlimited = std::numeric_limits<size_t>::max();

/**
 * @brief Duplex byte pipe over one blocking serial transport
 *
 * A reader thread appends everything the device sends to the incoming
 * buffer. A writer thread sends the outgoing buffer in fixed-size chunks.
 * Callers only touch the buffers under the engine mutex, so write() never
 * blocks and reads/drains wait on a condition variable (blocking API) or on
 * a waker timer (asynchronous API).
 *
 * The first transport error becomes the engine's fault and every later
 * operation rethrows it. close() installs IoClosedException, which then
 * takes precedence for new callers; the earlier fault stays reachable
 * through IoClosedException::cause().
 *
 * Asynchronous operations complete on the executor given to create(). That
 * executor must not run handlers concurrently (a single-threaded io_context
 * or a strand), since the waker timers are only touched from it.
 */
class SERIALTRACK_API IoEngine : public std::enable_shared_from_this<IoEngine> {
 public:
  using Executor = boost::asio::any_io_executor;

  static std::shared_ptr<IoEngine> create(std::unique_ptr<transport::SerialTransport> transport,
                                          const config::ConnectionConfig& cfg, Executor executor);

  ~IoEngine();

  IoEngine(const IoEngine&) = delete;
  IoEngine& operator=(const IoEngine&) = delete;

  /**
   * @brief Launch the reader and writer threads
   */
  void start();

  /**
   * @brief Wait for incoming data and take it
   * @param timeout nullopt waits forever, zero checks once
   * @param max_bytes Upper bound on the returned size
   * @return The bytes taken, empty on timeout
   * @throws IoException, IoClosedException once the engine is faulted
   */
  Bytes read_sync(util::Timeout timeout = std::nullopt, size_t max_bytes = kUnlimited);

  /**
   * @brief Queue bytes for sending. Never blocks.
   *
   * An empty write only checks for a recorded fault.
   */
  void write(const uint8_t* data, size_t size);
  void write(const Bytes& data) { write(data.data(), data.size()); }
  void write(std::string_view data) { write(reinterpret_cast<const uint8_t*>(data.data()), data.size()); }

  /**
   * @brief Wait until at most @p threshold bytes remain unsent
   * @return true when drained, false on timeout
   */
  bool drain_sync(util::Timeout timeout = std::nullopt, size_t threshold = 0);

  size_t incoming_size() const;
  size_t outgoing_size() const;

  transport::SerialSignals get_signals();

  /**
   * @brief Change DTR, RTS and break; nullopt leaves a line untouched
   */
  void set_signals(std::optional<bool> dtr, std::optional<bool> rts, std::optional<bool> send_break);

  /**
   * @brief Fault the engine with IoClosedException, cancel transport I/O and join the workers
   *
   * Unread input and unsent output are discarded. Idempotent. The transport
   * itself stays open until close_transport().
   */
  void close();
  void close_transport();

  bool is_closed() const;
  std::exception_ptr fault() const;

  const std::string& port_name() const { return port_name_; }
  int native_handle() const;
  const Executor& get_executor() const { return executor_; }

  /**
   * @brief Asynchronous read_sync
   *
   * Completion signature: void(std::exception_ptr, Bytes). Completes as soon
   * as any data is available or a fault is recorded.
   */
  template <typename CompletionToken>
  auto async_read(CompletionToken&& token, size_t max_bytes = kUnlimited) {
    return boost::asio::async_compose<CompletionToken, void(std::exception_ptr, Bytes)>(
        ReadOp{shared_from_this(), max_bytes}, token, executor_);
  }

  /**
   * @brief Asynchronous drain_sync
   *
   * Completion signature: void(std::exception_ptr, bool). The bool is
   * always true when there is no error.
   */
  template <typename CompletionToken>
  auto async_drain(CompletionToken&& token, size_t threshold = 0) {
    return boost::asio::async_compose<CompletionToken, void(std::exception_ptr, bool)>(
        DrainOp{shared_from_this(), threshold}, token, executor_);
  }

 private:
  using Waker = std::shared_ptr<boost::asio::steady_timer>;

  IoEngine(std::unique_ptr<transport::SerialTransport> transport, const config::ConnectionConfig& cfg,
           Executor executor);

  void read_loop();
  void write_loop();

  bool wait_until(std::unique_lock<std::mutex>& lock, util::Deadline deadline);
  void record_fault_locked(std::exception_ptr fault);
  std::vector<Waker> take_wakers_locked();
  void resolve_wakers(std::vector<Waker> wakers);
  std::exception_ptr signal_fault(const std::string& operation, const std::string& message,
                                  const boost::system::error_code& ec);

  Waker register_waker();
  void drop_waker(const Waker& waker);

  struct ReadOp {
    std::shared_ptr<IoEngine> engine;
    size_t max_bytes;
    bool on_executor = false;
    Waker waker;

    template <typename Self>
    void operator()(Self& self, boost::system::error_code = {}) {
      if (!on_executor) {
        on_executor = true;
        auto ex = engine->executor_;
        boost::asio::post(ex, std::move(self));
        return;
      }

      // Register before checking so a wake between the two is not lost
      waker = engine->register_waker();
      Bytes data;
      try {
        data = engine->read_sync(util::Clock::duration::zero(), max_bytes);
      } catch (const std::exception&) {
        engine->drop_waker(waker);
        self.complete(std::current_exception(), Bytes{});
        return;
      }
      if (!data.empty()) {
        engine->drop_waker(waker);
        self.complete(nullptr, std::move(data));
        return;
      }
      auto timer = waker;
      timer->async_wait(std::move(self));
    }
  };

  struct DrainOp {
    std::shared_ptr<IoEngine> engine;
    size_t threshold;
    bool on_executor = false;
    Waker waker;

    template <typename Self>
    void operator()(Self& self, boost::system::error_code = {}) {
      if (!on_executor) {
        on_executor = true;
        auto ex = engine->executor_;
        boost::asio::post(ex, std::move(self));
        return;
      }

      waker = engine->register_waker();
      bool drained = false;
      try {
        drained = engine->drain_sync(util::Clock::duration::zero(), threshold);
      } catch (const std::exception&) {
        engine->drop_waker(waker);
        self.complete(std::current_exception(), false);
        return;
      }
      if (drained) {
        engine->drop_waker(waker);
        self.complete(nullptr, true);
        return;
      }
      auto timer = waker;
      timer->async_wait(std::move(self));
    }
  };

  std::string port_name_;
  std::unique_ptr<transport::SerialTransport> transport_;
  size_t write_chunk_;
  size_t read_chunk_;
  Executor executor_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  Bytes incoming_;
  Bytes outgoing_;
  std::exception_ptr fault_;
  bool closed_{false};
  std::vector<Waker> wakers_;

  std::mutex join_mutex_;
  std::thread reader_;
  std::thread writer_;
};

}  // namespace io
}  // namespace serialtrack
