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

#include <set>
#include <string>
#include <vector>

#include "serialtrack/diagnostics/exceptions.hpp"
#include "serialtrack/discovery/glob_matcher.hpp"

using namespace serialtrack;
using namespace serialtrack::discovery;

namespace {

PortInfo ftdi_port() {
  return PortInfo{"/dev/ttyUSB0",
                  {{"device", "/dev/ttyUSB0"},
                   {"name", "ttyUSB0"},
                   {"vid_pid", "0403:6001"},
                   {"product", "FT232R USB UART"},
                   {"serial_number", "A50285BI"}}};
}

PortInfo acm_port() {
  return PortInfo{"/dev/ttyACM0",
                  {{"device", "/dev/ttyACM0"},
                   {"name", "ttyACM0"},
                   {"vid_pid", "2341:0043"},
                   {"product", "Arduino Uno JTAG"}}};
}

size_t error_position(const std::string& expression) {
  try {
    GlobMatcher matcher(expression);
  } catch (const diagnostics::MatcherException& e) {
    EXPECT_EQ(e.get_expression(), expression);
    return e.get_position();
  }
  ADD_FAILURE() << "expected MatcherException for: " << expression;
  return std::string::npos;
}

}  // namespace

TEST(GlobMatcherTest, ParsesTerms) {
  GlobMatcher matcher("  usb  !PRODUCT:*jtag*  vid_pid:0403:* 'two words' a:b:c ");

  const auto& terms = matcher.terms();
  ASSERT_EQ(terms.size(), 5u);

  EXPECT_EQ(terms[0].key, "");
  EXPECT_EQ(terms[0].pattern, "usb");
  EXPECT_FALSE(terms[0].negated);

  EXPECT_EQ(terms[1].key, "product");
  EXPECT_EQ(terms[1].pattern, "*jtag*");
  EXPECT_TRUE(terms[1].negated);

  EXPECT_EQ(terms[2].key, "vid_pid");
  EXPECT_EQ(terms[2].pattern, "0403:*");

  EXPECT_EQ(terms[3].key, "");
  EXPECT_EQ(terms[3].pattern, "two words");

  EXPECT_EQ(terms[4].key, "a");
  EXPECT_EQ(terms[4].pattern, "b:c");
}

TEST(GlobMatcherTest, PatternStartingWithDigitHasNoKey) {
  GlobMatcher matcher("0403:6001");

  ASSERT_EQ(matcher.terms().size(), 1u);
  EXPECT_EQ(matcher.terms()[0].key, "");
  EXPECT_TRUE(matcher.matches(ftdi_port()));
  EXPECT_FALSE(matcher.matches(acm_port()));
}

TEST(GlobMatcherTest, EmptyExpressionMatchesEverything) {
  GlobMatcher matcher("   ");

  EXPECT_TRUE(matcher.terms().empty());
  EXPECT_TRUE(matcher.matches(ftdi_port()));
  EXPECT_TRUE(matcher.matches(PortInfo{"/dev/ttyS0", {}}));
}

TEST(GlobMatcherTest, WholeValueCaseInsensitive) {
  EXPECT_TRUE(GlobMatcher("ttyusb0").matches(ftdi_port()));
  EXPECT_TRUE(GlobMatcher("*USB*").matches(ftdi_port()));
  // Substrings need wildcards
  EXPECT_FALSE(GlobMatcher("USB").matches(ftdi_port()));
  EXPECT_TRUE(GlobMatcher("ttyUSB?").matches(ftdi_port()));
  EXPECT_TRUE(GlobMatcher("ttyUSB[0-3]").matches(ftdi_port()));
  EXPECT_FALSE(GlobMatcher("ttyUSB[4-9]").matches(ftdi_port()));
}

TEST(GlobMatcherTest, KeyRestrictsAttribute) {
  EXPECT_TRUE(GlobMatcher("serial_number:a50285bi").matches(ftdi_port()));
  EXPECT_TRUE(GlobMatcher("VID_PID:0403:6001").matches(ftdi_port()));
  EXPECT_FALSE(GlobMatcher("product:ttyUSB0").matches(ftdi_port()));
  EXPECT_FALSE(GlobMatcher("nosuchkey:*").matches(ftdi_port()));
}

TEST(GlobMatcherTest, AllTermsMustHold) {
  std::vector<PortInfo> ports = {ftdi_port(), acm_port()};

  auto usb_ftdi = GlobMatcher("*USB* vid_pid:0403:*").filter(ports);
  ASSERT_EQ(usb_ftdi.size(), 1u);
  EXPECT_EQ(usb_ftdi[0].name, "/dev/ttyUSB0");

  EXPECT_TRUE(GlobMatcher("*USB* vid_pid:2341:*").filter(ports).empty());
  EXPECT_EQ(GlobMatcher("*uno* *jtag*").filter(ports).size(), 1u);
  EXPECT_EQ(GlobMatcher("/dev/tty*").filter(ports).size(), 2u);
}

TEST(GlobMatcherTest, NegationRejects) {
  std::vector<PortInfo> ports = {ftdi_port(), acm_port()};

  auto not_jtag = GlobMatcher("!product:*JTAG*").filter(ports);
  ASSERT_EQ(not_jtag.size(), 1u);
  EXPECT_EQ(not_jtag[0].name, "/dev/ttyUSB0");

  // Negation alone against any attribute
  EXPECT_EQ(GlobMatcher("!*acm*").filter(ports).size(), 1u);
  EXPECT_TRUE(GlobMatcher("!*").filter(ports).empty());
}

TEST(GlobMatcherTest, QuotedPatterns) {
  EXPECT_TRUE(GlobMatcher("product:'FT232R USB UART'").matches(ftdi_port()));
  EXPECT_TRUE(GlobMatcher("\"*usb uart\"").matches(ftdi_port()));
  EXPECT_FALSE(GlobMatcher("'FT232R'").matches(ftdi_port()));

  // Escaped quote inside quotes
  PortInfo quoted{"/dev/ttyX", {{"product", "it's"}}};
  EXPECT_TRUE(GlobMatcher("product:'it\\'s'").matches(quoted));
}

TEST(GlobMatcherTest, EscapesAreLiteral) {
  PortInfo star{"/dev/ttyX", {{"product", "a*b"}}};
  PortInfo plain{"/dev/ttyY", {{"product", "axxb"}}};

  GlobMatcher matcher("product:a\\*b");
  EXPECT_TRUE(matcher.matches(star));
  EXPECT_FALSE(matcher.matches(plain));
}

TEST(GlobMatcherTest, MatchedKeys) {
  GlobMatcher matcher("*usb* vid_pid:0403:* !product:*jtag*");

  std::set<std::string> expected = {"device", "name", "product", "vid_pid"};
  EXPECT_EQ(matcher.matched_keys(ftdi_port()), expected);

  EXPECT_EQ(matcher.str(), "*usb* vid_pid:0403:* !product:*jtag*");
}

TEST(GlobMatcherTest, ErrorsCarryPosition) {
  EXPECT_EQ(error_position(":foo"), 0u);
  EXPECT_EQ(error_position("product:"), 8u);
  EXPECT_EQ(error_position("ok !"), 4u);
  EXPECT_EQ(error_position("x product:'open"), 10u);
  EXPECT_EQ(error_position("'a'b"), 3u);
  EXPECT_EQ(error_position("tail\\"), 4u);
}

TEST(GlobMatcherTest, ErrorMessagePointsAtProblem) {
  try {
    GlobMatcher matcher("a:'x");
    FAIL() << "expected MatcherException";
  } catch (const diagnostics::MatcherException& e) {
    EXPECT_EQ(std::string(e.what()), "Bad port matcher (unterminated quote):\n  a:'x\n  --^");
  }
}
