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

#include "serialtrack/discovery/device_scanner.hpp"

#include <sys/stat.h>

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "serialtrack/diagnostics/error_handler.hpp"
#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/diagnostics/logger.hpp"

namespace serialtrack {
namespace discovery {

namespace fs = std::filesystem;
using json = nlohmann::json;

using diagnostics::ScanException;

namespace {

std::string read_sysfs_value(const fs::path& path) {
  std::ifstream in(path);
  std::string value;
  if (!in || !std::getline(in, value)) {
    return "";
  }
  while (!value.empty() && (value.back() == '\n' || value.back() == '\r' || value.back() == ' ')) {
    value.pop_back();
  }
  return value;
}

std::string link_target_name(const fs::path& link) {
  std::error_code ec;
  auto target = fs::read_symlink(link, ec);
  return ec ? std::string() : target.filename().string();
}

// ISO 8601 local time with microseconds, e.g. 2025-03-01T12:34:56.123456
std::string modification_time(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return "";
  }
  struct tm local;
  if (::localtime_r(&st.st_mtim.tv_sec, &local) == nullptr) {
    return "";
  }
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &local);
  char frac[16];
  std::snprintf(frac, sizeof(frac), ".%06ld", static_cast<long>(st.st_mtim.tv_nsec / 1000));
  return std::string(date) + frac;
}

void set_if_present(PortInfo& port, const std::string& key, const std::string& value) {
  if (!value.empty() && value != "n/a") {
    port.attr[key] = value;
  }
}

[[noreturn]] void fail_scan(const std::string& message, const std::string& source) {
  SERIALTRACK_LOG_ERROR("scanner", "scan", message);
  diagnostics::error_reporting::report_scan_error("scanner", message);
  throw ScanException(message, source);
}

}  // namespace

SysfsScanner::SysfsScanner(std::string sysfs_dir, std::string dev_dir)
    : sysfs_dir_(std::move(sysfs_dir)), dev_dir_(std::move(dev_dir)) {}

std::vector<PortInfo> SysfsScanner::scan() {
  std::vector<PortInfo> ports;

  std::error_code ec;
  fs::directory_iterator it(sysfs_dir_, ec);
  if (ec) {
    fail_scan("Can't scan serial ports in " + sysfs_dir_ + ": " + ec.message(), sysfs_dir_);
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      fail_scan("Can't scan serial ports in " + sysfs_dir_ + ": " + ec.message(), sysfs_dir_);
    }

    const fs::path entry = it->path();
    std::error_code entry_ec;
    const fs::path device = fs::canonical(entry / "device", entry_ec);
    if (entry_ec) {
      continue;  // virtual terminal
    }

    const std::string subsystem = link_target_name(device / "subsystem");
    if (subsystem == "platform") {
      continue;
    }

    PortInfo port;
    const std::string name = entry.filename().string();
    port.name = dev_dir_ + "/" + name;
    port.attr["device"] = port.name;
    port.attr["name"] = name;
    set_if_present(port, "subsystem", subsystem);
    set_if_present(port, "driver", link_target_name(device / "driver"));

    if (subsystem == "usb" || subsystem == "usb-serial") {
      const fs::path usb_interface = subsystem == "usb-serial" ? device.parent_path() : device;
      const fs::path usb_device = usb_interface.parent_path();

      const std::string vid = read_sysfs_value(usb_device / "idVendor");
      const std::string pid = read_sysfs_value(usb_device / "idProduct");
      set_if_present(port, "vid", vid);
      set_if_present(port, "pid", pid);
      if (!vid.empty() && !pid.empty()) {
        port.attr["vid_pid"] = vid + ":" + pid;
      }
      set_if_present(port, "serial_number", read_sysfs_value(usb_device / "serial"));
      set_if_present(port, "manufacturer", read_sysfs_value(usb_device / "manufacturer"));
      set_if_present(port, "product", read_sysfs_value(usb_device / "product"));
      set_if_present(port, "interface", read_sysfs_value(usb_interface / "interface"));
      set_if_present(port, "location", usb_interface.filename().string());
    }

    set_if_present(port, "time", modification_time(port.name));
    ports.push_back(std::move(port));
  }

  sort_by_name(ports);
  SERIALTRACK_LOG_DEBUG("scanner", "scan", "Found " + std::to_string(ports.size()) + " ports");
  return ports;
}

JsonFileScanner::JsonFileScanner(std::string path) : path_(std::move(path)) {}

std::vector<PortInfo> JsonFileScanner::scan() {
  std::ifstream file(path_);
  if (!file.is_open()) {
    fail_scan("Can't open scan override " + path_, path_);
  }

  json root;
  try {
    file >> root;
  } catch (const json::exception& e) {
    fail_scan("Can't read scan override " + path_ + ": " + e.what(), path_);
  }
  if (!root.is_object()) {
    fail_scan("Bad scan override " + path_ + ": expected an object of ports", path_);
  }

  std::vector<PortInfo> ports;
  for (const auto& entry : root.items()) {
    if (!entry.value().is_object()) {
      fail_scan("Bad scan override " + path_ + ": port entries must be objects", path_);
    }
    PortInfo port;
    port.name = entry.key();
    for (const auto& attr : entry.value().items()) {
      if (!attr.value().is_string()) {
        fail_scan("Bad scan override " + path_ + ": attributes of " + port.name + " must be strings", path_);
      }
      port.attr[attr.key()] = attr.value().get<std::string>();
    }
    ports.push_back(std::move(port));
  }

  sort_by_name(ports);
  SERIALTRACK_LOG_DEBUG("scanner", "scan", "Read " + std::to_string(ports.size()) + " ports from " + path_);
  return ports;
}

std::shared_ptr<DeviceScanner> make_default_scanner() {
  const char* override_path = std::getenv(common::constants::SCAN_OVERRIDE_ENV);
  if (override_path != nullptr && *override_path != '\0') {
    SERIALTRACK_LOG_DEBUG("scanner", "create",
                          std::string("Using $") + common::constants::SCAN_OVERRIDE_ENV + " " + override_path);
    return std::make_shared<JsonFileScanner>(override_path);
  }
  return std::make_shared<SysfsScanner>();
}

}  // namespace discovery
}  // namespace serialtrack
