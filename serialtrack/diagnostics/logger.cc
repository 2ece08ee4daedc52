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

#include "serialtrack/diagnostics/logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace serialtrack {
namespace diagnostics {

namespace {

const char* level_name(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
  }
  return "UNKNOWN";
}

std::string format_line(LogLevel level, std::string_view component, std::string_view operation,
                        std::string_view message) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm local{};
  ::localtime_r(&seconds, &local);

  std::ostringstream line;
  line << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms << " ["
       << level_name(level) << "] [" << component << "] [" << operation << "] " << message;
  return line.str();
}

}  // namespace

struct Logger::Impl {
  std::mutex mutex;
  std::atomic<LogLevel> level{LogLevel::INFO};
  std::atomic<int> outputs{static_cast<int>(LogOutput::CONSOLE)};
  std::ofstream file;
  std::shared_ptr<LogCallback> callback;
};

Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger& Logger::instance() {
  // Leaked so that logging from static destructors stays valid
  static Logger* instance = new Logger();
  return *instance;
}

void Logger::set_level(LogLevel level) { impl_->level.store(level); }

LogLevel Logger::get_level() const { return impl_->level.load(); }

void Logger::set_file_output(const std::string& filename) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->file.is_open()) {
    impl_->file.close();
  }
  impl_->outputs.fetch_and(~static_cast<int>(LogOutput::FILE));
  if (filename.empty()) {
    return;
  }
  impl_->file.open(filename, std::ios::app);
  if (!impl_->file.is_open()) {
    std::cerr << "Failed to open log file: " << filename << std::endl;
    return;
  }
  impl_->outputs.fetch_or(static_cast<int>(LogOutput::FILE));
}

void Logger::set_callback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (callback) {
    impl_->callback = std::make_shared<LogCallback>(std::move(callback));
    impl_->outputs.fetch_or(static_cast<int>(LogOutput::CALLBACK));
  } else {
    impl_->callback.reset();
    impl_->outputs.fetch_and(~static_cast<int>(LogOutput::CALLBACK));
  }
}

void Logger::set_outputs(int outputs) { impl_->outputs.store(outputs); }

void Logger::flush() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->file.is_open()) {
    impl_->file.flush();
  }
  std::cout.flush();
}

void Logger::log(LogLevel level, std::string_view component, std::string_view operation, std::string_view message) {
  if (level < impl_->level.load()) {
    return;
  }
  const std::string line = format_line(level, component, operation, message);
  const int outputs = impl_->outputs.load();

  if (outputs & static_cast<int>(LogOutput::CONSOLE)) {
    if (level >= LogLevel::ERROR) {
      std::cerr << line << std::endl;
    } else {
      std::cout << line << '\n';
    }
  }

  std::shared_ptr<LogCallback> callback;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if ((outputs & static_cast<int>(LogOutput::FILE)) && impl_->file.is_open()) {
      impl_->file << line << '\n';
    }
    if (outputs & static_cast<int>(LogOutput::CALLBACK)) {
      callback = impl_->callback;
    }
  }

  // Invoked unlocked so a callback may log or call back into the library
  if (callback) {
    try {
      (*callback)(level, line);
    } catch (const std::exception& e) {
      std::cerr << "Error in log callback: " << e.what() << std::endl;
    }
  }
}

void Logger::debug(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::DEBUG, component, operation, message);
}

void Logger::info(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::INFO, component, operation, message);
}

void Logger::warning(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::WARNING, component, operation, message);
}

void Logger::error(std::string_view component, std::string_view operation, std::string_view message) {
  log(LogLevel::ERROR, component, operation, message);
}

}  // namespace diagnostics
}  // namespace serialtrack
