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

#include <iostream>
#include <string>

#include "serialtrack/serialtrack.hpp"

using namespace serialtrack;

namespace {

void print_usage(const char* prog) {
  std::cout << "Usage: " << prog << " [-l|--list] [-1|--one] [-v|--verbose] [match]\n"
            << "  -l  print device names only\n"
            << "  -1  fail unless exactly one port matches\n"
            << "  -v  print all attributes of each port\n";
}

}  // namespace

int main(int argc, char** argv) {
  bool list_only = false;
  bool one = false;
  bool verbose = false;
  std::string match;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-l" || arg == "--list") {
      list_only = true;
    } else if (arg == "-1" || arg == "--one") {
      one = true;
    } else if (arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else if (match.empty()) {
      match = arg;
    } else {
      match += " " + arg;
    }
  }
  if (one && !verbose) list_only = true;

  diagnostics::Logger::instance().set_level(verbose ? diagnostics::LogLevel::DEBUG : diagnostics::LogLevel::WARNING);

  try {
    GlobMatcher matcher(match);
    auto ports = matcher.filter(discovery::make_default_scanner()->scan());

    if (one && ports.size() != 1) {
      std::cerr << (ports.empty() ? "No ports match" : std::to_string(ports.size()) + " ports match") << " '"
                << matcher.str() << "'\n";
      return 1;
    }

    for (const auto& port : ports) {
      if (list_only) {
        std::cout << port.name << "\n";
        continue;
      }

      auto hits = matcher.matched_keys(port);
      if (!verbose) {
        std::cout << port.name;
        for (const auto& key : {"product", "manufacturer", "serial_number", "vid_pid"}) {
          auto it = port.attr.find(key);
          if (it != port.attr.end()) std::cout << "  " << it->second;
        }
        std::cout << "\n";
        continue;
      }

      std::cout << port.name << "\n";
      for (const auto& kv : port.attr) {
        std::cout << (hits.count(kv.first) ? "  * " : "    ") << kv.first << ": " << kv.second << "\n";
      }
    }
    if (ports.empty() && !list_only) {
      std::cerr << "No ports match '" << matcher.str() << "'\n";
    }
  } catch (const diagnostics::SerialException& e) {
    std::cerr << e.get_full_message() << "\n";
    return 2;
  }
  return 0;
}
