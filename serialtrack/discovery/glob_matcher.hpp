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

#include <string>
#include <vector>

#include "serialtrack/base/visibility.hpp"
#include "serialtrack/discovery/port_matcher.hpp"

namespace serialtrack {
namespace discovery {

/**
 * @brief Port filter built from whitespace separated glob terms
 *
 * Term syntax: [!][key:]pattern
 *  - pattern is a shell glob (*, ?, [...]) matched against the whole
 *    attribute value, ignoring case; it may be quoted with ' or "
 *  - key restricts the term to one attribute, otherwise any attribute counts
 *  - ! rejects ports where the term matches
 *
 * A port matches when every plain term matches some attribute and no
 * negated term does. An empty expression matches every port.
 *
 *   GlobMatcher m("vid_pid:0403:* !product:'*JTAG*'");
 */
class SERIALTRACK_API GlobMatcher : public PortMatcher {
 public:
  struct Term {
    std::string key;  // lowercase, empty for any attribute
    std::string pattern;
    bool negated = false;
  };

  /**
   * @throws MatcherException on malformed input, with the error position
   */
  explicit GlobMatcher(std::string expression);

  bool matches(const PortInfo& port) const override;
  std::set<std::string> matched_keys(const PortInfo& port) const override;
  std::string str() const override { return expression_; }

  const std::vector<Term>& terms() const { return terms_; }

 private:
  static bool term_hits(const Term& term, const std::string& key, const std::string& value);

  std::string expression_;
  std::vector<Term> terms_;
};

}  // namespace discovery
}  // namespace serialtrack
