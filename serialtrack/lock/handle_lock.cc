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

#include "serialtrack/lock/handle_lock.hpp"

#include <sys/file.h>
#include <sys/ioctl.h>
#include <termios.h>

#include <cerrno>

#include "serialtrack/diagnostics/error_handler.hpp"
#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/diagnostics/logger.hpp"

namespace serialtrack {
namespace lock {

namespace {

boost::system::error_code last_error() { return boost::system::error_code(errno, boost::system::system_category()); }

void warn(const std::string& operation, const std::string& port, const std::string& what,
          const boost::system::error_code& ec) {
  SERIALTRACK_LOG_WARNING("lock", operation, what + " " + port + " - " + ec.message());
  diagnostics::error_reporting::report_lock_warning(operation, port, what, ec);
}

bool would_block(int err) { return err == EWOULDBLOCK || err == EAGAIN; }

}  // namespace

HandleLock::HandleLock(int fd, std::string port, SharingMode mode) : fd_(fd), port_(std::move(port)), mode_(mode) {
  if (mode_ == SharingMode::Polite) {
    // Probe for an exclusive holder, then settle for a shared lock
    bool ok = ::flock(fd_, LOCK_EX | LOCK_NB) == 0 && ::flock(fd_, LOCK_UN | LOCK_NB) == 0 &&
              ::flock(fd_, LOCK_SH | LOCK_NB) == 0;
    if (ok) {
      flocked_ = true;
      SERIALTRACK_LOG_DEBUG("lock", "acquire", "Acquired flock(LOCK_SH) on " + port_);
    } else {
      auto ec = last_error();
      if (would_block(ec.value())) {
        throw diagnostics::PortBusyException(port_ + " is busy (flock)", port_, ec);
      }
      warn("acquire", port_, "Can't lock (flock)", ec);
    }
  } else if (mode_ != SharingMode::Oblivious) {
    if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
      flocked_ = true;
      SERIALTRACK_LOG_DEBUG("lock", "acquire", "Acquired flock(LOCK_EX) on " + port_);
    } else {
      auto ec = last_error();
      if (would_block(ec.value()) && mode_ == SharingMode::Exclusive) {
        throw diagnostics::PortBusyException(port_ + " is busy (flock)", port_, ec);
      }
      warn("acquire", port_, "Can't lock (flock)", ec);
    }
  }

  if (mode_ == SharingMode::Exclusive || mode_ == SharingMode::Stomp) {
    if (::ioctl(fd_, TIOCEXCL) == 0) {
      tiocexcl_ = true;
      SERIALTRACK_LOG_DEBUG("lock", "acquire", "Acquired TIOCEXCL on " + port_);
    } else {
      warn("acquire", port_, "Can't lock (TIOCEXCL)", last_error());
    }
  }
}

HandleLock::~HandleLock() { release(); }

void HandleLock::release() {
  if (released_) {
    return;
  }
  released_ = true;

  if (tiocexcl_) {
    if (::ioctl(fd_, TIOCNXCL) == 0) {
      SERIALTRACK_LOG_DEBUG("lock", "release", "Released TIOCEXCL on " + port_);
    } else {
      warn("release", port_, "Can't release TIOCEXCL on", last_error());
    }
    tiocexcl_ = false;
  }

  if (flocked_) {
    if (::flock(fd_, LOCK_UN | LOCK_NB) == 0) {
      SERIALTRACK_LOG_DEBUG("lock", "release", "Released flock on " + port_);
    } else {
      warn("release", port_, "Can't release flock on", last_error());
    }
    flocked_ = false;
  }
}

}  // namespace lock
}  // namespace serialtrack
