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

#include "serialtrack/tracker/port_tracker.hpp"

#include <algorithm>
#include <thread>

#include "serialtrack/common/io_context_manager.hpp"
#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/diagnostics/logger.hpp"
#include "serialtrack/discovery/glob_matcher.hpp"

namespace serialtrack {
namespace tracker {

using diagnostics::IoClosedException;
using diagnostics::IoException;
using diagnostics::OpenException;

std::shared_ptr<PortTracker> PortTracker::create(const config::TrackerConfig& cfg, ConnectionContext ctx,
                                                 std::shared_ptr<discovery::PortMatcher> matcher) {
  if (!cfg.is_valid()) {
    throw diagnostics::ConfigurationException("Invalid tracker settings", "tracker");
  }
  if (!matcher) {
    matcher = std::make_shared<discovery::GlobMatcher>(cfg.match);
  }
  if (!ctx.scanner) {
    ctx.scanner = discovery::make_default_scanner();
  }
  if (!ctx.executor) {
    ctx.executor = common::IoContextManager::instance().get_executor();
  }
  return std::shared_ptr<PortTracker>(new PortTracker(cfg, std::move(ctx), std::move(matcher)));
}

PortTracker::PortTracker(const config::TrackerConfig& cfg, ConnectionContext ctx,
                         std::shared_ptr<discovery::PortMatcher> matcher)
    : config_(cfg),
      context_(std::move(ctx)),
      matcher_(std::move(matcher)),
      scanner_(context_.scanner),
      executor_(context_.executor) {
  const std::string match = matcher_->str();
  SERIALTRACK_LOG_DEBUG("tracker", "create", "Tracking: " + (match.empty() ? std::string("(any port)") : match));
}

PortTracker::~PortTracker() {
  try {
    close();
  } catch (const std::exception& e) {
    SERIALTRACK_LOG_ERROR("tracker", "close", std::string("Error closing tracked connection: ") + e.what());
  }
}

util::Deadline PortTracker::next_scan() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return next_scan_;
}

uint64_t PortTracker::wait_generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return wait_generation_;
}

bool PortTracker::add_wait(uint64_t generation, const WaitTimer& timer) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (generation != wait_generation_) {
    return false;
  }
  waits_.erase(std::remove_if(waits_.begin(), waits_.end(), [](const auto& w) { return w.expired(); }),
               waits_.end());
  for (const auto& w : waits_) {
    if (w.lock() == timer) {
      return true;
    }
  }
  waits_.push_back(timer);
  return true;
}

std::vector<PortInfo> PortTracker::find_sync(util::Timeout timeout) {
  const util::Deadline deadline = util::to_deadline(timeout);
  for (;;) {
    util::Clock::duration wait;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const auto now = util::Clock::now();
      if (now >= next_scan_) {
        auto found = scanner_->scan();
        std::set<std::string> keys;
        for (auto& port : found) {
          keys.insert(port.key());
          if (scanned_ && scan_keys_.count(port.key()) == 0) {
            port.attr["tracking"] = "new";
          }
        }

        matched_ = matcher_->filter(found);
        scan_keys_ = std::move(keys);
        scanned_ = true;
        next_scan_ = util::to_deadline(std::chrono::duration_cast<util::Clock::duration>(config_.scan_interval), now);
        SERIALTRACK_LOG_DEBUG("tracker", "find",
                              std::to_string(matched_.size()) + "/" + std::to_string(found.size()) +
                                  " ports match '" + matcher_->str() + "'");
      }

      if (!matched_.empty()) {
        return matched_;
      }
      wait = next_scan_ - now;
    }

    const util::Timeout remaining = util::from_deadline(deadline);
    if (remaining && *remaining <= util::Clock::duration::zero()) {
      return {};
    }
    if (remaining) {
      wait = std::min(wait, *remaining);
    }
    std::this_thread::sleep_for(wait);
  }
}

std::shared_ptr<SerialConnection> PortTracker::connect_sync(util::Timeout timeout) {
  const util::Deadline deadline = util::to_deadline(timeout);
  std::vector<PortInfo> candidates;
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (conn_) {
        try {
          conn_->write(io::Bytes{});  // liveness probe
          return conn_;
        } catch (const IoClosedException&) {
          SERIALTRACK_LOG_DEBUG("tracker", "connect", conn_->port_name() + " closed");
          conn_.reset();
        } catch (const IoException& e) {
          SERIALTRACK_LOG_WARNING("tracker", "connect", conn_->port_name() + " failed (" + e.what() + ")");
          conn_->close();
          conn_.reset();
        }
      }

      for (const auto& port : candidates) {
        try {
          conn_ = SerialConnection::open(port.name, config_.connection, context_);
          return conn_;
        } catch (const OpenException& e) {
          SERIALTRACK_LOG_WARNING("tracker", "connect", "Can't open " + port.name + " (" + e.what() + ")");
          matched_.clear();  // rescan once the interval is up
        }
      }
    }

    candidates = find_sync(util::from_deadline(deadline));
    if (candidates.empty()) {
      return nullptr;
    }
  }
}

void PortTracker::close() {
  std::vector<WaitTimer> waits;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++wait_generation_;
    for (const auto& w : waits_) {
      if (auto timer = w.lock()) {
        waits.push_back(std::move(timer));
      }
    }
    waits_.clear();
    if (conn_) {
      conn_->close();
    }
  }

  // Timers belong to the executor; a wait begun before the bump is cancelled here
  if (!waits.empty()) {
    SERIALTRACK_LOG_DEBUG("tracker", "close", "Cancelling " + std::to_string(waits.size()) + " pending wait(s)");
    boost::asio::post(executor_, [waits]() {
      for (const auto& timer : waits) {
        timer->cancel();
      }
    });
  }
}

}  // namespace tracker
}  // namespace serialtrack
