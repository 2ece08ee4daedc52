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

#include "serialtrack/lock/marker_lock.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include "serialtrack/diagnostics/error_handler.hpp"
#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/diagnostics/logger.hpp"

namespace serialtrack {
namespace lock {

using namespace common;
using diagnostics::PortBusyException;

namespace {

boost::system::error_code last_error() { return boost::system::error_code(errno, boost::system::system_category()); }

void warn(const std::string& operation, const std::string& path, const std::string& what,
          const boost::system::error_code& ec) {
  SERIALTRACK_LOG_WARNING("lock", operation, what + " " + path + (ec ? " - " + ec.message() : std::string()));
  diagnostics::error_reporting::report_lock_warning(operation, path, what, ec);
}

void remove_stale(const std::string& path) {
  if (::unlink(path.c_str()) == 0) {
    SERIALTRACK_LOG_DEBUG("lock", "inspect", "Removed bad/stale " + path);
  } else if (errno != ENOENT) {
    warn("inspect", path, "Can't remove", last_error());
  }
}

std::optional<pid_t> parse_pid(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  if (begin == end || end - begin > 10) return std::nullopt;

  long value = 0;
  for (size_t i = begin; i < end; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    value = value * 10 + (text[i] - '0');
  }
  if (value <= 0 || value > 0x7fffffffL) return std::nullopt;
  return static_cast<pid_t>(value);
}

}  // namespace

MarkerLock::MarkerLock(std::string port, SharingMode mode, std::string lock_dir,
                       std::shared_ptr<ProcessControl> process)
    : port_(std::move(port)),
      mode_(mode),
      lock_dir_(std::move(lock_dir)),
      path_(marker_path(lock_dir_, port_)),
      process_(process ? std::move(process) : default_process_control()) {
  for (int attempt = 0; attempt < constants::MAX_LOCK_ATTEMPTS; ++attempt) {
    if (try_acquire() == Attempt::Done) {
      return;
    }
  }
  throw PortBusyException(port_ + " is busy (contention retries exceeded)", port_);
}

MarkerLock::~MarkerLock() { release(); }

std::string MarkerLock::marker_path(const std::string& lock_dir, const std::string& port) {
  static const std::string dev_prefix = "/dev/";
  std::string name;
  if (port.compare(0, dev_prefix.size(), dev_prefix) == 0) {
    name = port.substr(dev_prefix.size());
  } else {
    name = std::filesystem::path(port).filename().string();
  }
  for (auto& c : name) {
    if (c == '/') c = '.';
  }
  return (std::filesystem::path(lock_dir) / (std::string(constants::LOCK_FILE_PREFIX) + name)).string();
}

std::optional<pid_t> MarkerLock::read_owner(const std::string& path, const ProcessControl& process) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (errno != ENOENT) {
      warn("inspect", path, "Can't check", last_error());
    }
    return std::nullopt;
  }

  char buf[constants::MAX_LOCK_FILE_READ];
  ssize_t n = ::read(fd, buf, sizeof(buf));
  auto read_ec = n < 0 ? last_error() : boost::system::error_code{};
  ::close(fd);
  if (n < 0) {
    warn("inspect", path, "Can't check", read_ec);
    return std::nullopt;
  }

  auto pid = parse_pid(std::string(buf, static_cast<size_t>(n)));
  if (!pid || !process.is_alive(*pid)) {
    remove_stale(path);
    return std::nullopt;
  }
  return pid;
}

MarkerLock::Attempt MarkerLock::try_acquire() {
  if (mode_ == SharingMode::Oblivious) {
    return Attempt::Done;
  }

  std::error_code fs_ec;
  if (!std::filesystem::is_directory(lock_dir_, fs_ec)) {
    SERIALTRACK_LOG_DEBUG("lock", "acquire", "No lock directory " + lock_dir_);
    return Attempt::Done;
  }

  const pid_t self = process_->self_pid();
  if (auto owner = read_owner(path_, *process_)) {
    if (*owner == self) {
      SERIALTRACK_LOG_DEBUG("lock", "acquire", "We already own " + path_);
      return Attempt::Done;
    }

    if (mode_ != SharingMode::Stomp) {
      SERIALTRACK_LOG_DEBUG("lock", "acquire", "PID " + std::to_string(*owner) + " owns " + path_);
      throw PortBusyException(port_ + " is busy (" + path_ + ": pid=" + std::to_string(*owner) + ")", port_);
    }

    boost::system::error_code ec;
    process_->terminate(*owner, ec);
    if (ec) {
      warn("stomp", path_, "Can't kill owner " + std::to_string(*owner) + " of", ec);
    } else {
      SERIALTRACK_LOG_DEBUG("lock", "stomp", "Killed owner " + std::to_string(*owner) + " of " + path_);
    }
  }

  int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (mode_ == SharingMode::Stomp ? O_TRUNC : O_EXCL);
  int fd = ::open(path_.c_str(), flags, 0644);
  if (fd < 0) {
    if (errno == EEXIST) {
      SERIALTRACK_LOG_WARNING("lock", "acquire", "Conflict creating " + path_);
      return Attempt::Conflict;
    }
    warn("acquire", path_, "Can't create", last_error());
    return Attempt::Done;
  }

  char record[32];
  int len = std::snprintf(record, sizeof(record), "%*d\n", constants::LOCK_PID_FIELD_WIDTH, static_cast<int>(self));
  size_t written = 0;
  while (len > 0 && written < static_cast<size_t>(len)) {
    ssize_t n = ::write(fd, record + written, static_cast<size_t>(len) - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      warn("acquire", path_, "Can't write", last_error());
      break;
    }
    written += static_cast<size_t>(n);
  }
  ::close(fd);

  SERIALTRACK_LOG_DEBUG("lock", "acquire", "Claimed " + path_);
  return Attempt::Done;
}

void MarkerLock::release() {
  if (released_) {
    return;
  }
  released_ = true;

  if (mode_ == SharingMode::Oblivious) {
    return;
  }

  auto owner = read_owner(path_, *process_);
  if (!owner || *owner != process_->self_pid()) {
    return;
  }

  if (::unlink(path_.c_str()) == 0) {
    SERIALTRACK_LOG_DEBUG("lock", "release", "Released " + path_);
  } else {
    warn("release", path_, "Can't release", last_error());
  }
}

}  // namespace lock
}  // namespace serialtrack
