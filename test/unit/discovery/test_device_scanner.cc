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

#include <gtest/gtest.h>
#include <stdlib.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "serialtrack/common/constants.hpp"
#include "serialtrack/diagnostics/error_handler.hpp"
#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/discovery/device_scanner.hpp"
#include "utils/test_utils.hpp"

using namespace serialtrack;
using namespace serialtrack::discovery;
using serialtrack::diagnostics::ScanException;
using serialtrack::test::TempDir;
using serialtrack::test::TestUtils;

namespace fs = std::filesystem;

TEST(PortInfoTest, NaturalOrder) {
  EXPECT_TRUE(natural_less("/dev/ttyUSB2", "/dev/ttyUSB10"));
  EXPECT_FALSE(natural_less("/dev/ttyUSB10", "/dev/ttyUSB2"));
  EXPECT_TRUE(natural_less("/dev/ttyACM9", "/dev/ttyUSB0"));
  EXPECT_FALSE(natural_less("/dev/ttyS1", "/dev/ttyS1"));

  std::vector<PortInfo> ports = {{"/dev/ttyUSB10", {}}, {"/dev/ttyUSB2", {}}, {"/dev/ttyACM0", {}}};
  sort_by_name(ports);
  EXPECT_EQ(ports[0].name, "/dev/ttyACM0");
  EXPECT_EQ(ports[1].name, "/dev/ttyUSB2");
  EXPECT_EQ(ports[2].name, "/dev/ttyUSB10");
}

TEST(PortInfoTest, KeyIncludesTime) {
  PortInfo port{"/dev/ttyUSB0", {{"time", "2025-03-01T12:00:00.000000"}}};
  EXPECT_EQ(port.key(), "/dev/ttyUSB0@2025-03-01T12:00:00.000000");

  PortInfo untimed{"/dev/ttyS0", {}};
  EXPECT_EQ(untimed.key(), "/dev/ttyS0@");
}

/**
 * @brief JSON listing scanner used for tests and $SERIALTRACK_SCAN_OVERRIDE
 */
class JsonFileScannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    path_ = (dir_.path() / "ports.json").string();
    diagnostics::ErrorHandler::instance().reset_stats();
  }

  void TearDown() override { diagnostics::ErrorHandler::instance().reset_stats(); }

  TempDir dir_;
  std::string path_;
};

TEST_F(JsonFileScannerTest, ReadsSortedListing) {
  // Given
  TestUtils::writeFile(path_, R"({
    "/dev/ttyUSB10": {"vid_pid": "0403:6001", "serial_number": "B"},
    "/dev/ttyUSB2": {"vid_pid": "0403:6001", "serial_number": "A"},
    "/dev/ttyS0": {}
  })");

  // When
  auto ports = JsonFileScanner(path_).scan();

  // Then
  ASSERT_EQ(ports.size(), 3u);
  EXPECT_EQ(ports[0].name, "/dev/ttyS0");
  EXPECT_TRUE(ports[0].attr.empty());
  EXPECT_EQ(ports[1].name, "/dev/ttyUSB2");
  EXPECT_EQ(ports[1].attr.at("serial_number"), "A");
  EXPECT_EQ(ports[2].name, "/dev/ttyUSB10");
  EXPECT_EQ(ports[2].attr.at("vid_pid"), "0403:6001");
}

TEST_F(JsonFileScannerTest, RereadsOnEveryScan) {
  JsonFileScanner scanner(path_);

  TestUtils::writeFile(path_, "{}");
  EXPECT_TRUE(scanner.scan().empty());

  TestUtils::writeFile(path_, R"({"/dev/ttyACM0": {"product": "Uno"}})");
  auto ports = scanner.scan();
  ASSERT_EQ(ports.size(), 1u);
  EXPECT_EQ(ports[0].attr.at("product"), "Uno");
}

TEST_F(JsonFileScannerTest, MissingFileFails) {
  EXPECT_THROW(JsonFileScanner((dir_.path() / "absent.json").string()).scan(), ScanException);
  EXPECT_TRUE(diagnostics::ErrorHandler::instance().has_errors("scanner"));
}

TEST_F(JsonFileScannerTest, MalformedJsonFails) {
  TestUtils::writeFile(path_, "{\"/dev/ttyUSB0\": {");
  EXPECT_THROW(JsonFileScanner(path_).scan(), ScanException);
}

TEST_F(JsonFileScannerTest, WrongShapeFails) {
  TestUtils::writeFile(path_, R"(["/dev/ttyUSB0"])");
  EXPECT_THROW(JsonFileScanner(path_).scan(), ScanException);

  TestUtils::writeFile(path_, R"({"/dev/ttyUSB0": "not an object"})");
  EXPECT_THROW(JsonFileScanner(path_).scan(), ScanException);

  TestUtils::writeFile(path_, R"({"/dev/ttyUSB0": {"nested": {"a": "b"}}})");
  EXPECT_THROW(JsonFileScanner(path_).scan(), ScanException);
}

TEST_F(JsonFileScannerTest, DefaultScannerHonorsOverride) {
  TestUtils::writeFile(path_, R"({"/dev/ttyFAKE": {}})");

  ::setenv(common::constants::SCAN_OVERRIDE_ENV, path_.c_str(), 1);
  auto scanner = make_default_scanner();
  ::unsetenv(common::constants::SCAN_OVERRIDE_ENV);

  auto* json = dynamic_cast<JsonFileScanner*>(scanner.get());
  ASSERT_NE(json, nullptr);
  EXPECT_EQ(json->path(), path_);
  ASSERT_EQ(scanner->scan().size(), 1u);

  EXPECT_NE(dynamic_cast<SysfsScanner*>(make_default_scanner().get()), nullptr);
}

/**
 * @brief Fake /sys/class/tty tree laid out like the kernel's
 */
class SysfsScannerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    root_ = dir_.path();
    tty_ = root_ / "class" / "tty";
    dev_ = root_ / "dev";
    fs::create_directories(tty_);
    fs::create_directories(dev_);
    fs::create_directories(root_ / "bus" / "usb-serial");
    fs::create_directories(root_ / "bus" / "usb");
    fs::create_directories(root_ / "bus" / "platform");
    fs::create_directories(root_ / "drivers" / "ftdi_sio");
    fs::create_directories(root_ / "drivers" / "cdc_acm");
  }

  // tty entry whose "device" link points at @p device_dir
  void add_tty(const std::string& name, const fs::path& device_dir, const std::string& subsystem,
               const std::string& driver = "") {
    fs::create_directories(device_dir);
    fs::create_directory_symlink(root_ / "bus" / subsystem, device_dir / "subsystem");
    if (!driver.empty()) {
      fs::create_directory_symlink(root_ / "drivers" / driver, device_dir / "driver");
    }
    fs::create_directories(tty_ / name);
    fs::create_directory_symlink(device_dir, tty_ / name / "device");
  }

  TempDir dir_;
  fs::path root_;
  fs::path tty_;
  fs::path dev_;
};

TEST_F(SysfsScannerTest, ListsUsbAndSkipsVirtualAndPlatform) {
  // Given: FTDI adapter, behind a usb-serial port node
  fs::path ftdi_usb = root_ / "devices" / "usb1" / "1-1";
  fs::path ftdi_intf = ftdi_usb / "1-1:1.0";
  add_tty("ttyUSB0", ftdi_intf / "ttyUSB0", "usb-serial", "ftdi_sio");
  TestUtils::writeFile(ftdi_usb / "idVendor", "0403\n");
  TestUtils::writeFile(ftdi_usb / "idProduct", "6001\n");
  TestUtils::writeFile(ftdi_usb / "serial", "A50285BI\n");
  TestUtils::writeFile(ftdi_usb / "manufacturer", "FTDI\n");
  TestUtils::writeFile(ftdi_usb / "product", "FT232R USB UART\n");
  TestUtils::writeFile(dev_ / "ttyUSB0", "");

  // CDC ACM board, the interface is the device itself
  fs::path acm_usb = root_ / "devices" / "usb1" / "1-2";
  fs::path acm_intf = acm_usb / "1-2:1.0";
  add_tty("ttyACM0", acm_intf, "usb", "cdc_acm");
  TestUtils::writeFile(acm_usb / "idVendor", "2341\n");
  TestUtils::writeFile(acm_usb / "idProduct", "0043\n");
  TestUtils::writeFile(acm_intf / "interface", "CDC Abstract Control Model (ACM)\n");

  // Platform UART with nothing behind it, and a virtual console
  add_tty("ttyS0", root_ / "devices" / "platform" / "serial8250", "platform");
  fs::create_directories(tty_ / "tty0");

  // When
  auto ports = SysfsScanner(tty_.string(), dev_.string()).scan();

  // Then
  ASSERT_EQ(ports.size(), 2u);

  const auto& acm = ports[0];
  EXPECT_EQ(acm.name, dev_.string() + "/ttyACM0");
  EXPECT_EQ(acm.attr.at("device"), acm.name);
  EXPECT_EQ(acm.attr.at("name"), "ttyACM0");
  EXPECT_EQ(acm.attr.at("subsystem"), "usb");
  EXPECT_EQ(acm.attr.at("driver"), "cdc_acm");
  EXPECT_EQ(acm.attr.at("vid_pid"), "2341:0043");
  EXPECT_EQ(acm.attr.at("interface"), "CDC Abstract Control Model (ACM)");
  EXPECT_EQ(acm.attr.at("location"), "1-2:1.0");
  EXPECT_EQ(acm.attr.count("serial_number"), 0u);
  EXPECT_EQ(acm.attr.count("time"), 0u);  // no device node

  const auto& ftdi = ports[1];
  EXPECT_EQ(ftdi.attr.at("name"), "ttyUSB0");
  EXPECT_EQ(ftdi.attr.at("subsystem"), "usb-serial");
  EXPECT_EQ(ftdi.attr.at("driver"), "ftdi_sio");
  EXPECT_EQ(ftdi.attr.at("vid"), "0403");
  EXPECT_EQ(ftdi.attr.at("pid"), "6001");
  EXPECT_EQ(ftdi.attr.at("vid_pid"), "0403:6001");
  EXPECT_EQ(ftdi.attr.at("serial_number"), "A50285BI");
  EXPECT_EQ(ftdi.attr.at("manufacturer"), "FTDI");
  EXPECT_EQ(ftdi.attr.at("product"), "FT232R USB UART");
  EXPECT_EQ(ftdi.attr.at("location"), "1-1:1.0");
  ASSERT_EQ(ftdi.attr.count("time"), 1u);
  EXPECT_EQ(ftdi.attr.at("time").size(), std::string("2025-03-01T12:34:56.123456").size());
  EXPECT_EQ(ftdi.key(), ftdi.name + "@" + ftdi.attr.at("time"));
}

TEST_F(SysfsScannerTest, MissingSysfsFails) {
  EXPECT_THROW(SysfsScanner((root_ / "nowhere").string(), dev_.string()).scan(), ScanException);
}

TEST_F(SysfsScannerTest, EmptyTreeListsNothing) {
  EXPECT_TRUE(SysfsScanner(tty_.string(), dev_.string()).scan().empty());
}
