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
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "serialtrack/base/visibility.hpp"
#include "serialtrack/config/tracker_config.hpp"
#include "serialtrack/connection/serial_connection.hpp"
#include "serialtrack/discovery/device_scanner.hpp"
#include "serialtrack/discovery/port_matcher.hpp"
#include "serialtrack/util/deadline.hpp"

namespace serialtrack {
namespace tracker {

using connection::ConnectionContext;
using connection::SerialConnection;
using discovery::PortInfo;

/**
 * @brief Keeps a connection to a port of interest across unplug/replug
 *
 * Scans for matching ports at most once per scan interval, opens the first
 * one that works and hands the same connection out until it fails, then
 * finds and opens a replacement.
 *
 * @code
 * config::TrackerConfig cfg;
 * cfg.match = "vid_pid:0403:6001";
 * auto tracker = PortTracker::create(cfg);
 * for (;;) {
 *   auto conn = tracker->connect_sync();
 *   try {
 *     auto data = conn->read_sync();
 *   } catch (const diagnostics::IoException&) {
 *     // next connect_sync() reconnects
 *   }
 * }
 * @endcode
 */
class SERIALTRACK_API PortTracker : public std::enable_shared_from_this<PortTracker> {
 public:
  using Executor = boost::asio::any_io_executor;

  /**
   * @param matcher Overrides the GlobMatcher built from cfg.match
   * @throws ConfigurationException, MatcherException
   */
  static std::shared_ptr<PortTracker> create(const config::TrackerConfig& cfg, ConnectionContext ctx = {},
                                             std::shared_ptr<discovery::PortMatcher> matcher = nullptr);

  ~PortTracker();

  PortTracker(const PortTracker&) = delete;
  PortTracker& operator=(const PortTracker&) = delete;

  /**
   * @brief Wait until matching ports exist, rescanning periodically
   * @return The matching ports, empty on timeout
   * @throws ScanException
   */
  std::vector<PortInfo> find_sync(util::Timeout timeout = std::nullopt);

  /**
   * @brief Return the remembered connection if healthy, else open a new one
   *
   * Candidates are tried in scan order; ports that fail to open are skipped.
   *
   * @return The connection, nullptr on timeout
   * @throws ScanException
   */
  std::shared_ptr<SerialConnection> connect_sync(util::Timeout timeout = std::nullopt);

  /**
   * @brief find_sync without a timeout, completing on the tracker executor
   *
   * Completion signature: void(std::exception_ptr, std::vector<PortInfo>).
   * close() ends the wait with no error and an empty result.
   */
  template <typename CompletionToken>
  auto async_find(CompletionToken&& token) {
    return boost::asio::async_compose<CompletionToken, void(std::exception_ptr, std::vector<PortInfo>)>(
        FindOp{shared_from_this()}, token, executor_);
  }

  /**
   * @brief connect_sync without a timeout, completing on the tracker executor
   *
   * Completion signature: void(std::exception_ptr, std::shared_ptr<SerialConnection>).
   * close() ends the wait with no error and a null connection.
   */
  template <typename CompletionToken>
  auto async_connect(CompletionToken&& token) {
    return boost::asio::async_compose<CompletionToken, void(std::exception_ptr, std::shared_ptr<SerialConnection>)>(
        ConnectOp{shared_from_this()}, token, executor_);
  }

  /**
   * @brief Close the remembered connection and end pending async waits
   *
   * The tracker stays usable; a later connect opens a new connection.
   */
  void close();

  const discovery::PortMatcher& matcher() const { return *matcher_; }
  const config::TrackerConfig& config() const { return config_; }
  const Executor& get_executor() const { return executor_; }

 private:
  PortTracker(const config::TrackerConfig& cfg, ConnectionContext ctx, std::shared_ptr<discovery::PortMatcher> matcher);

  util::Deadline next_scan() const;

  using WaitTimer = std::shared_ptr<boost::asio::steady_timer>;
  uint64_t wait_generation() const;
  // False once close() has run since the wait began
  bool add_wait(uint64_t generation, const WaitTimer& timer);

  // Polls with a zero timeout, sleeping on a timer until the next scan is due
  template <typename Derived>
  struct PollOp {
    std::shared_ptr<PortTracker> tracker;
    bool started = false;
    uint64_t generation = 0;
    WaitTimer timer;

    template <typename Self>
    void operator()(Self& self, boost::system::error_code ec = {}) {
      if (!started) {
        started = true;
        generation = tracker->wait_generation();
        auto ex = tracker->executor_;
        boost::asio::post(ex, std::move(self));
        return;
      }
      if (ec == boost::asio::error::operation_aborted) {
        self.complete(nullptr, typename Derived::Result{});
        return;
      }

      typename Derived::Result result{};
      try {
        result = Derived::poll(*tracker);
      } catch (const std::exception&) {
        self.complete(std::current_exception(), typename Derived::Result{});
        return;
      }
      if (Derived::ready(result)) {
        self.complete(nullptr, std::move(result));
        return;
      }

      if (!timer) {
        timer = std::make_shared<boost::asio::steady_timer>(tracker->executor_);
      }
      timer->expires_at(tracker->next_scan());
      if (!tracker->add_wait(generation, timer)) {
        self.complete(nullptr, typename Derived::Result{});
        return;
      }
      auto t = timer;
      t->async_wait(std::move(self));
    }
  };

  struct FindPolicy {
    using Result = std::vector<PortInfo>;
    static Result poll(PortTracker& t) { return t.find_sync(util::Clock::duration::zero()); }
    static bool ready(const Result& r) { return !r.empty(); }
  };

  struct ConnectPolicy {
    using Result = std::shared_ptr<SerialConnection>;
    static Result poll(PortTracker& t) { return t.connect_sync(util::Clock::duration::zero()); }
    static bool ready(const Result& r) { return r != nullptr; }
  };

  using FindOp = PollOp<FindPolicy>;
  using ConnectOp = PollOp<ConnectPolicy>;

  config::TrackerConfig config_;
  ConnectionContext context_;
  std::shared_ptr<discovery::PortMatcher> matcher_;
  std::shared_ptr<discovery::DeviceScanner> scanner_;
  Executor executor_;

  mutable std::mutex mutex_;
  bool scanned_{false};
  util::Deadline next_scan_{};
  std::set<std::string> scan_keys_;
  std::vector<PortInfo> matched_;
  std::shared_ptr<SerialConnection> conn_;
  uint64_t wait_generation_{0};
  std::vector<std::weak_ptr<boost::asio::steady_timer>> waits_;
};

}  // namespace tracker
}  // namespace serialtrack
